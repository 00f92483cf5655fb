////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.06 Initial version.
//      2026.10.18 Hang up query.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../error.hpp"
#include "../exports.hpp"
#include "../namespace.hpp"
#include <chrono>
#include <vector>
#include <poll.h>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

class poll_poller
{
public:
    using socket_id = int;

public:
    std::vector<pollfd> events;
    short int oevents; // Observable events

public:
    LANSEEK__EXPORT poll_poller (short int observable_events = POLLIN);
    LANSEEK__EXPORT ~poll_poller ();

    LANSEEK__EXPORT void add_socket (socket_id sock);

    /**
     * Waits for events on registered sockets at most @a millis.
     *
     * @return Number of sockets with events, zero on timeout or interruption
     *         by a signal, negative value on failure.
     */
    LANSEEK__EXPORT int poll (std::chrono::milliseconds millis, error * perr = nullptr);

    /**
     * Checks if @a sock was shut down (hang up reported by last call to poll()).
     */
    LANSEEK__EXPORT bool hangup (socket_id sock) const noexcept;
};

} // namespace posix

LANSEEK__NAMESPACE_END
