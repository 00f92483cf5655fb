////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.06 Initial version.
//      2026.10.18 Hang up query.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cerrno>

LANSEEK__NAMESPACE_BEGIN

namespace posix {

poll_poller::poll_poller (short int observable_events)
    : oevents(observable_events)
{}

poll_poller::~poll_poller () = default;

void poll_poller::add_socket (socket_id sock)
{
    auto pos = std::find_if(events.begin(), events.end()
        , [& sock] (pollfd const & p) { return sock == p.fd;});

    // Already exists
    if (pos != events.end())
        return;

    pollfd ev;
    ev.fd = sock;
    ev.events = oevents;
    ev.revents = 0;
    events.push_back(ev);
}

int poll_poller::poll (std::chrono::milliseconds millis, error * perr)
{
    if (millis < std::chrono::milliseconds{0})
        millis = std::chrono::milliseconds{0};

    for (auto & ev: events)
        ev.revents = 0;

    auto n = ::poll(events.data(), events.size(), static_cast<int>(millis.count()));

    if (n < 0) {
        // Is not a critical error
        if (errno == EINTR)
            return 0;

        pfs::throw_or(perr, error {
              make_error_code(errc::poller_error)
            , tr::_("poll failure")
            , pfs::system_error_text()
        });
    }

    return n;
}

bool poll_poller::hangup (socket_id sock) const noexcept
{
    auto pos = std::find_if(events.begin(), events.end()
        , [& sock] (pollfd const & p) { return sock == p.fd;});

    return pos != events.end() && (pos->revents & POLLHUP);
}

} // namespace posix

LANSEEK__NAMESPACE_END
