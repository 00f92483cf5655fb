////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.16 Initial version.
//      2026.10.18 Ephemeral binding on construction.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/posix/udp_sender.hpp"
#include <utility>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

udp_sender::udp_sender (inet4_addr const & local_addr)
    : udp_socket()
{
    bind(socket4_addr{local_addr, 0});
    enable_broadcast(true);
}

udp_sender::udp_sender (udp_sender && s) noexcept
    : udp_socket(std::move(s))
{}

udp_sender & udp_sender::operator = (udp_sender && s) noexcept
{
    udp_socket::operator = (std::move(s));
    return *this;
}

udp_sender::~udp_sender () = default;

bool udp_sender::enable_broadcast (bool enable, error * perr)
{
    return udp_socket::enable_broadcast(enable, perr);
}

} // namespace posix

LANSEEK__NAMESPACE_END
