////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.17 Initial version.
//      2026.10.18 Port range check.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/socket4_addr.hpp"
#include <pfs/integer.hpp>
#include <system_error>

LANSEEK__NAMESPACE_BEGIN

pfs::optional<socket4_addr> socket4_addr::parse (std::string const & s)
{
    // "A.B.C.D:PORT", address part is checked by inet4_addr::parse()
    auto colon_pos = s.rfind(':');

    if (colon_pos == std::string::npos || colon_pos + 1 == s.size())
        return pfs::nullopt;

    auto addr = inet4_addr::parse(s.c_str(), colon_pos);

    if (!addr)
        return pfs::nullopt;

    std::error_code ec;
    auto port_text = s.c_str() + colon_pos + 1;
    auto port = pfs::to_integer(port_text, s.c_str() + s.size()
        , std::uint16_t{1}, std::uint16_t{65535}, ec);

    if (ec)
        return pfs::nullopt;

    socket4_addr result;
    result.addr = *addr;
    result.port = port;

    return result;
}

LANSEEK__NAMESPACE_END
