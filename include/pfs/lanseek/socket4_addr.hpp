////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2022.08.15 Initial version.
//      2026.10.18 Single parse overload.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "inet4_addr.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>

LANSEEK__NAMESPACE_BEGIN

/**
 * IPv4 socket address. Also identifies a discovered server endpoint.
 */
class socket4_addr
{
public:
    inet4_addr    addr;
    std::uint16_t port {0};

public:
    /**
     * Parses socket address in format "A.B.C.D:PORT", port must be in range [1, 65535].
     */
    static LANSEEK__EXPORT pfs::optional<socket4_addr> parse (std::string const & s);
};

inline std::string to_string (socket4_addr const & saddr)
{
    return to_string(saddr.addr) + ':' + std::to_string(saddr.port);
}

inline bool operator == (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr == b.addr && a.port == b.port;
}

inline bool operator != (socket4_addr const & a, socket4_addr const & b)
{
    return !(a == b);
}

inline bool operator < (socket4_addr const & a, socket4_addr const & b)
{
    if (a.addr < b.addr)
        return true;

    if (a.addr == b.addr)
        return a.port < b.port;

    return false;
}

LANSEEK__NAMESPACE_END
