////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.18 Removed multicast group membership.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/posix/udp_socket.hpp"
#include <pfs/i18n.hpp>
#include <utility>
#include <sys/types.h>
#include <sys/socket.h>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

udp_socket::udp_socket () : inet_socket(SOCK_DGRAM) {}

udp_socket::udp_socket (udp_socket && s) noexcept
    : inet_socket(std::move(s))
{}

udp_socket & udp_socket::operator = (udp_socket && s) noexcept
{
    inet_socket::operator = (std::move(s));
    return *this;
}

udp_socket::~udp_socket () = default;

bool udp_socket::enable_broadcast (bool enable, error * perr)
{
    int const on = enable ? 1 : 0;

    auto rc = ::setsockopt(_socket, SOL_SOCKET, SO_BROADCAST, & on, sizeof(on));

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("{} broadcast", (enable ? tr::_("enable") : tr::_("disable")))
            , pfs::system_error_text()
        });

        return false;
    }

    return true;
}

} // namespace posix

LANSEEK__NAMESPACE_END
