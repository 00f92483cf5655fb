////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2025.05.06 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <functional>

LANSEEK__NAMESPACE_BEGIN

template <typename T>
using callback_t = std::function<T>;

LANSEEK__NAMESPACE_END
