////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.18 Added `shutdown()`.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../error.hpp"
#include "../exports.hpp"
#include "../inet4_addr.hpp"
#include "../namespace.hpp"
#include "../send_result.hpp"
#include "../socket4_addr.hpp"

#if _MSC_VER
#   include <winsock2.h>
#endif

LANSEEK__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX inet socket
 */
class inet_socket
{
public:
#if _MSC_VER
    using socket_id = SOCKET;
    static socket_id const kINVALID_SOCKET = INVALID_SOCKET;
#else
    using socket_id = int;
    static socket_id constexpr kINVALID_SOCKET = -1;
#endif

protected:
    socket_id _socket { kINVALID_SOCKET };

    // Bound address
    socket4_addr _saddr;

protected:
    /**
     * Constructs invalid POSIX socket
     */
    inet_socket ();

    /**
     * Constructs non-blocking POSIX socket of @a socktype (SOCK_DGRAM, ...)
     * with address reuse enabled.
     */
    explicit inet_socket (int socktype);

    inet_socket (inet_socket const &) = delete;
    inet_socket & operator = (inet_socket const &) = delete;

    LANSEEK__EXPORT ~inet_socket ();

    LANSEEK__EXPORT inet_socket (inet_socket &&) noexcept;
    LANSEEK__EXPORT inet_socket & operator = (inet_socket &&) noexcept;

protected:
    bool bind (socket4_addr const & saddr, error * perr = nullptr);

public:
    /**
     *  Checks if socket is valid
     */
    LANSEEK__EXPORT operator bool () const noexcept;

    LANSEEK__EXPORT socket_id id () const noexcept;

    /**
     * Returns address the socket is bound to. For ephemeral binding the port
     * is the one assigned by the system.
     */
    LANSEEK__EXPORT socket4_addr saddr () const noexcept;

    /**
     * Receives datagram without blocking.
     *
     * @return Number of bytes received (zero for an empty datagram or shut down
     *         socket), -1 if no datagram is pending or on error reported
     *         through @a perr.
     */
    LANSEEK__EXPORT int recv_from (char * data, int len, socket4_addr * saddr = nullptr
        , error * perr = nullptr);

    /**
     * Sends datagram @a data with @a len bytes to @a dest without blocking.
     */
    LANSEEK__EXPORT send_result send_to (socket4_addr const & dest, char const * data, int len
        , error * perr = nullptr);

    /**
     * Disables further receive and send operations.
     *
     * @details Wakes up any thread waiting for this socket in a poller.
     *          The descriptor remains valid until the socket is destroyed.
     */
    LANSEEK__EXPORT void shutdown () noexcept;
};

} // namespace posix

LANSEEK__NAMESPACE_END
