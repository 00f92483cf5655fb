////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2021.10.26 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstdint>

LANSEEK__NAMESPACE_BEGIN

enum class send_status {
      failure   = -1
    , good      =  0
    , again     =  1
    , overflow  =  2

    // Network is down (ENETDOWN)
    // Network is unreachable (ENETUNREACH)
    , network   =  3
};

struct send_result
{
    send_status state;
    std::int64_t n;
};

LANSEEK__NAMESPACE_END
