////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.06 Initial version.
//      2026.10.18 Removed UDT initialization.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/startup.hpp"
#include <pfs/assert.hpp>
#include <atomic>

#if _MSC_VER
#   define WIN32_LEAN_AND_MEAN
#   include <winsock2.h>
#endif

LANSEEK__NAMESPACE_BEGIN

static std::atomic_int startup_counter {0};

void startup ()
{
    if (startup_counter.fetch_add(1) == 0) {
#if _MSC_VER
        WSADATA wsa_data;
        auto version_requested = MAKEWORD(2, 2);

        auto rc = WSAStartup(version_requested, & wsa_data);
        PFS__TERMINATE(rc == 0, "WSAStartup failed: the Winsock 2.2 or newer dll was not found");
#endif
    }
}

void cleanup ()
{
    if (startup_counter.fetch_sub(1) == 1) {
#if _MSC_VER
        WSACleanup();
#endif
    }
}

LANSEEK__NAMESPACE_END
