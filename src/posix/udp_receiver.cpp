////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.16 Initial version.
//      2026.10.18 Removed multicast support.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/posix/udp_receiver.hpp"
#include <pfs/i18n.hpp>
#include <utility>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

udp_receiver::udp_receiver (socket4_addr const & local_saddr)
    : udp_socket()
{
    if (is_multicast(local_saddr.addr)) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::f_("expected unicast or broadcast address: {}"
                , to_string(local_saddr.addr))
        };
    }

    bind(local_saddr);
    enable_broadcast(true);
}

udp_receiver::udp_receiver (udp_receiver && s) noexcept
    : udp_socket(std::move(s))
{}

udp_receiver & udp_receiver::operator = (udp_receiver && s) noexcept
{
    udp_socket::operator = (std::move(s));
    return *this;
}

udp_receiver::~udp_receiver () = default;

} // namespace posix

LANSEEK__NAMESPACE_END
