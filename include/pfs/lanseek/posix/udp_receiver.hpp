////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.15 Initial version.
//      2026.10.18 Removed multicast support.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "udp_socket.hpp"

LANSEEK__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX UDP receiver socket
 */
class udp_receiver: public udp_socket
{
public:
    /**
     * Initializes unicast or broadcast receiver with binding to @a local_saddr.
     * Broadcast send is enabled to answer probes received via broadcast.
     *
     * @throws lanseek::error if @a local_saddr is a multicast address or
     *         binding failed.
     */
    LANSEEK__EXPORT udp_receiver (socket4_addr const & local_saddr);

    udp_receiver (udp_receiver const & s) = delete;
    udp_receiver & operator = (udp_receiver const & s) = delete;

    LANSEEK__EXPORT udp_receiver (udp_receiver && s) noexcept;
    LANSEEK__EXPORT udp_receiver & operator = (udp_receiver && s) noexcept;
    LANSEEK__EXPORT ~udp_receiver ();
};

} // namespace posix

LANSEEK__NAMESPACE_END
