////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.06 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"

LANSEEK__NAMESPACE_BEGIN

extern "C" LANSEEK__EXPORT void startup ();
extern "C" LANSEEK__EXPORT void cleanup ();

class startup_guard
{
public:
    startup_guard () { startup(); }
    ~startup_guard () { cleanup(); }
};

LANSEEK__NAMESPACE_END
