////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.18 Replaced regex based parser.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/inet4_addr.hpp"
#include <pfs/integer.hpp>
#include <algorithm>
#include <string>
#include <system_error>

LANSEEK__NAMESPACE_BEGIN

constexpr std::uint32_t inet4_addr::broadcast_addr_value;
constexpr std::uint32_t inet4_addr::any_addr_value;

std::string to_string (inet4_addr const & addr)
{
    auto value = static_cast<std::uint32_t>(addr);
    std::string result;

    result.reserve(15);
    result += std::to_string(0x000000FF & (value >> 24));
    result += '.';
    result += std::to_string(0x000000FF & (value >> 16));
    result += '.';
    result += std::to_string(0x000000FF & (value >> 8));
    result += '.';
    result += std::to_string(0x000000FF & value);

    return result;
}

pfs::optional<inet4_addr> inet4_addr::parse (char const * s, std::size_t n)
{
    auto first = s;
    auto last = s + n;
    std::uint32_t value = 0;

    for (int i = 0; i < 4; i++) {
        auto delim_pos = (i < 3) ? std::find(first, last, '.') : last;

        if (delim_pos == last && i < 3)
            return pfs::nullopt;

        // Empty or too long octet
        if (delim_pos == first || delim_pos - first > 3)
            return pfs::nullopt;

        std::error_code ec;
        auto octet = pfs::to_integer(first, delim_pos, std::uint16_t{0}, std::uint16_t{255}, ec);

        if (ec)
            return pfs::nullopt;

        value = (value << 8) | static_cast<std::uint32_t>(octet);
        first = (delim_pos == last) ? last : delim_pos + 1;
    }

    return inet4_addr{value};
}

pfs::optional<inet4_addr> inet4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

LANSEEK__NAMESPACE_END
