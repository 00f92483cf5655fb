////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../exports.hpp"
#include "../namespace.hpp"
#include <cstddef>
#include <string>
#include <vector>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

/*
 * Wire format
 *--------------------------------------------------------------------------------------------------
 * Probe (searcher -> advertiser, broadcast):
 *      UTF-8 bytes of the secret, no length prefix, no terminator.
 *
 * Acknowledgment (advertiser -> searcher, unicast):
 *      single byte with value 1 (boolean true).
 */
struct protocol
{
    static constexpr char ACK_VALUE = '\x01';
    static constexpr std::size_t ACK_SIZE = 1;

    static LANSEEK__EXPORT std::vector<char> make_probe (std::string const & secret);
    static LANSEEK__EXPORT std::vector<char> make_ack ();

    /**
     * Checks if datagram @a data of @a size bytes carries exactly @a secret.
     */
    static LANSEEK__EXPORT bool is_valid_probe (std::string const & secret, char const * data
        , std::size_t size) noexcept;

    /**
     * Checks if datagram @a data of @a size bytes is an acknowledgment.
     */
    static LANSEEK__EXPORT bool is_valid_ack (char const * data, std::size_t size) noexcept;
};

} // namespace discovery

LANSEEK__NAMESPACE_END
