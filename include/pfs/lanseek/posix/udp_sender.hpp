////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.18 Ephemeral binding on construction.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "udp_socket.hpp"

LANSEEK__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX UDP sender socket
 */
class udp_sender: public udp_socket
{
public:
    udp_sender (udp_sender const & s) = delete;
    udp_sender & operator = (udp_sender const & s) = delete;

    /**
     * Constructs UDP sender bound to ephemeral port on @a local_addr so that
     * replies to sent datagrams can be received on the same socket.
     */
    LANSEEK__EXPORT udp_sender (inet4_addr const & local_addr = inet4_addr{inet4_addr::any_addr_value});

    LANSEEK__EXPORT udp_sender (udp_sender && s) noexcept;
    LANSEEK__EXPORT udp_sender & operator = (udp_sender && s) noexcept;
    LANSEEK__EXPORT ~udp_sender ();

    /**
     * Enables/disables broadcast send.
     *
     * @param enable Enable (@c true) or disable (@c false) broadcast send.
     *
     * @return @c true if successful; otherwise it returns @c false.
     */
    LANSEEK__EXPORT bool enable_broadcast (bool enable, error * perr = nullptr);
};

} // namespace posix

LANSEEK__NAMESPACE_END
