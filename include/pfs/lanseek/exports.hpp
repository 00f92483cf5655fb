////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2021-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2021.06.21 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef LANSEEK__STATIC
#   ifndef LANSEEK__EXPORT
#       if _MSC_VER
#           if defined(LANSEEK__EXPORTS)
#               define LANSEEK__EXPORT __declspec(dllexport)
#           else
#               define LANSEEK__EXPORT __declspec(dllimport)
#           endif
#       else
#           define LANSEEK__EXPORT
#       endif
#   endif
#else
#   define LANSEEK__EXPORT
#endif // !LANSEEK__STATIC
