////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2024-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2024.12.26 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef LANSEEK__NAMESPACE_NAME
#   define LANSEEK__NAMESPACE_NAME lanseek
#   define LANSEEK__NAMESPACE_BEGIN namespace LANSEEK__NAMESPACE_NAME {
#   define LANSEEK__NAMESPACE_END }
#endif
