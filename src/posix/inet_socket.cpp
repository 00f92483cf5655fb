////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.18 Added `shutdown()`, bound address is queried after bind.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/posix/inet_socket.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

constexpr inet_socket::socket_id inet_socket::kINVALID_SOCKET;

inet_socket::inet_socket () = default;

inet_socket::inet_socket (int socktype)
{
    _socket = ::socket(AF_INET, socktype | SOCK_NONBLOCK, 0);

    if (_socket < 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("create INET socket failure")
            , pfs::system_error_text()
        };
    }

    int yes = 1;
    int rc = 0;

#if defined(SO_REUSEADDR)
    rc = ::setsockopt(_socket, SOL_SOCKET, SO_REUSEADDR, & yes, sizeof(int));
#endif

    if (rc != 0) {
        error err {
              make_error_code(errc::socket_error)
            , tr::_("set socket option failure")
            , pfs::system_error_text()
        };

        ::close(_socket);
        _socket = kINVALID_SOCKET;
        throw err;
    }
}

inet_socket::inet_socket (inet_socket && other) noexcept
    : _socket(other._socket)
    , _saddr(other._saddr)
{
    other._socket = kINVALID_SOCKET;
}

inet_socket & inet_socket::operator = (inet_socket && other) noexcept
{
    if (this != & other) {
        if (_socket != kINVALID_SOCKET)
            ::close(_socket);

        _socket = other._socket;
        _saddr  = other._saddr;
        other._socket = kINVALID_SOCKET;
    }

    return *this;
}

inet_socket::~inet_socket ()
{
    if (_socket != kINVALID_SOCKET) {
        ::close(_socket);
        _socket = kINVALID_SOCKET;
    }
}

inet_socket::operator bool () const noexcept
{
    return _socket != kINVALID_SOCKET;
}

inet_socket::socket_id inet_socket::id () const noexcept
{
    return _socket;
}

socket4_addr inet_socket::saddr () const noexcept
{
    return _saddr;
}

bool inet_socket::bind (socket4_addr const & saddr, error * perr)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    auto rc = ::bind(_socket
        , reinterpret_cast<sockaddr *>(& addr_in4)
        , sizeof(addr_in4));

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("bind name to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    _saddr = saddr;

    // Resolve the port assigned by the system for ephemeral binding
    if (saddr.port == 0) {
        socklen_t addr_in4_len = sizeof(addr_in4);

        rc = ::getsockname(_socket, reinterpret_cast<sockaddr *>(& addr_in4), & addr_in4_len);

        if (rc == 0)
            _saddr.port = pfs::to_native_order(static_cast<std::uint16_t>(addr_in4.sin_port));
    }

    return true;
}

int inet_socket::recv_from (char * data, int len, socket4_addr * saddr, error * perr)
{
    sockaddr_in addr_in4;
    std::memset(& addr_in4, 0, sizeof(addr_in4));
    socklen_t addr_in4_len = sizeof(addr_in4);

    auto n = ::recvfrom(_socket, data, static_cast<std::size_t>(len), MSG_DONTWAIT
        , reinterpret_cast<sockaddr *>(& addr_in4), & addr_in4_len);

    if (n < 0) {
        // No datagram pending
        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return -1;

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("receive data failure")
            , pfs::system_error_text()
        });

        return -1;
    }

    if (saddr) {
        saddr->port = pfs::to_native_order(static_cast<std::uint16_t>(addr_in4.sin_port));
        saddr->addr = pfs::to_native_order(static_cast<std::uint32_t>(addr_in4.sin_addr.s_addr));
    }

    return static_cast<int>(n);
}

send_result inet_socket::send_to (socket4_addr const & dest
    , char const * data, int len, error * perr)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(dest.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(dest.addr));

    // Datagram is sent entirely or not at all
    auto n = ::sendto(_socket, data, static_cast<std::size_t>(len), MSG_NOSIGNAL | MSG_DONTWAIT
        , reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (n < 0) {
        if (errno == ENOBUFS)
            return send_result{send_status::overflow, n};

        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return send_result{send_status::again, n};

        if (errno == ENETDOWN || errno == ENETUNREACH) {
            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::f_("network unreachable: {}", to_string(dest))
                , pfs::system_error_text()
            });

            return send_result{send_status::network, n};
        }

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("send to socket failure: {}", to_string(dest))
            , pfs::system_error_text()
        });

        return send_result{send_status::failure, n};
    }

    return send_result{send_status::good, n};
}

void inet_socket::shutdown () noexcept
{
    // For unconnected datagram socket the call fails with ENOTCONN but
    // nevertheless wakes up the pollers, so the result is ignored.
    if (_socket != kINVALID_SOCKET)
        ::shutdown(_socket, SHUT_RDWR);
}

} // namespace posix

LANSEEK__NAMESPACE_END
