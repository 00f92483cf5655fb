////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "inet_socket.hpp"

LANSEEK__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX Inet UDP socket
 */
class udp_socket: public inet_socket
{
protected:
    bool enable_broadcast (bool enable, error * perr = nullptr);

public:
    udp_socket (udp_socket const & s) = delete;
    udp_socket & operator = (udp_socket const & s) = delete;

    LANSEEK__EXPORT udp_socket ();
    LANSEEK__EXPORT udp_socket (udp_socket && s) noexcept;
    LANSEEK__EXPORT udp_socket & operator = (udp_socket && s) noexcept;
    LANSEEK__EXPORT ~udp_socket ();
};

} // namespace posix

LANSEEK__NAMESPACE_END
