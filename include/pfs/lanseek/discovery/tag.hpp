////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../namespace.hpp"

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

constexpr char const * DISCOVERY_TAG = "lanseek/discovery";

} // namespace discovery

LANSEEK__NAMESPACE_END
