////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.18 Parsing returns optional, dropped custom output formats.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

LANSEEK__NAMESPACE_BEGIN

/**
 * IPv4 address stored in host byte order.
 */
class inet4_addr
{
public:
    static constexpr std::uint32_t broadcast_addr_value = 0xFFFFFFFF;
    static constexpr std::uint32_t any_addr_value       = 0x00000000;

private:
    std::uint32_t _addr {0};

public:
    inet4_addr () = default;
    inet4_addr (inet4_addr const & x) = default;
    inet4_addr (inet4_addr && x) = default;
    inet4_addr & operator = (inet4_addr const & x) = default;
    inet4_addr & operator = (inet4_addr && x) = default;

    /**
     * Constructs address from four octets assigned in left-to-right order.
     */
    inet4_addr (std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
        : _addr(0)
    {
        _addr |= (static_cast<std::uint32_t>(a) << 24);
        _addr |= (static_cast<std::uint32_t>(b) << 16);
        _addr |= (static_cast<std::uint32_t>(c) << 8);
        _addr |= static_cast<std::uint32_t>(d);
    }

    inet4_addr (std::uint32_t a) : _addr(a)
    {}

    inet4_addr & operator = (std::uint32_t a)
    {
        _addr = a;
        return *this;
    }

    explicit operator std::uint32_t () const noexcept
    {
        return _addr;
    }

public: // static
    /**
     * Parses IPv4 address in dotted decimal notation ("A.B.C.D").
     */
    static LANSEEK__EXPORT pfs::optional<inet4_addr> parse (char const * s, std::size_t n);
    static LANSEEK__EXPORT pfs::optional<inet4_addr> parse (std::string const & s);
};

inline bool operator == (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) == static_cast<std::uint32_t>(b);
}

inline bool operator != (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) != static_cast<std::uint32_t>(b);
}

inline bool operator < (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) < static_cast<std::uint32_t>(b);
}

inline bool operator > (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) > static_cast<std::uint32_t>(b);
}

inline bool operator <= (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) <= static_cast<std::uint32_t>(b);
}

inline bool operator >= (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) >= static_cast<std::uint32_t>(b);
}

inline bool is_loopback (inet4_addr const & addr)
{
    return (static_cast<std::uint32_t>(addr) >> 24) == 127;
}

// https://en.wikipedia.org/wiki/Multicast_address
inline bool is_multicast (inet4_addr const & addr)
{
    return addr >= inet4_addr{224, 0, 0, 0}
        && addr <= inet4_addr{239, 255, 255, 255};
}

/**
 * Checks if @a addr is not multicast and last octet equals to @c 255.
 */
inline bool is_broadcast (inet4_addr const & addr)
{
    return !is_multicast(addr)
        && ((static_cast<std::uint32_t>(addr) & 0x000000FF) == 0x000000FF);
}

/**
 * Converts IPv4 address to string in dotted decimal notation.
 */
LANSEEK__EXPORT std::string to_string (inet4_addr const & addr);

LANSEEK__NAMESPACE_END
