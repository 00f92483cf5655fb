////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../error.hpp"
#include "../exports.hpp"
#include "../inet4_addr.hpp"
#include "../namespace.hpp"
#include "../property.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

struct options
{
    // Maximum datagram payload for 1500 bytes MTU (1500 - 20 (IP) - 8 (UDP))
    static constexpr std::size_t MAX_SECRET_SIZE = 1472;

    // Identifies compatible application instances, must be non-empty
    std::string secret;

    // Discovery port, must differ from the host transport port
    std::uint16_t port {0};

    // Delay before each probe transmission
    std::chrono::milliseconds interval {1000};

    // Receive operation limit
    std::chrono::milliseconds timeout {2000};

    // Drive roles from host connection state transitions
    bool automatic {false};

    // Stop searching after the first server is found
    bool single_result {false};

    // Probe destination address
    inet4_addr target_addr {inet4_addr::broadcast_addr_value};

    // Advertiser local address
    inet4_addr listener_addr {inet4_addr::any_addr_value};
};

/**
 * Loads options from property map.
 *
 * @details Recognized keys: "secret" (string), "port" (int),
 *          "interval" (int, milliseconds), "timeout" (int, milliseconds),
 *          "automatic" (bool), "single_result" (bool), "target_addr" (string),
 *          "listener_addr" (string). Absent keys keep default values.
 *
 * @throws lanseek::error (errc::invalid_argument) on bad property type or value.
 */
LANSEEK__EXPORT options load_options (property_map_t const & props);

/**
 * Checks @a opts and coerces durations to at least one millisecond.
 *
 * @return Normalized copy of @a opts.
 *
 * @throws lanseek::error (errc::invalid_argument) if secret is empty or too long,
 *         or port is zero.
 */
LANSEEK__EXPORT options normalize (options const & opts);

} // namespace discovery

LANSEEK__NAMESPACE_END
