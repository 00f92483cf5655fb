////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2025.03.11 Initial version.
//      2025.04.07 Moved to tools.hpp.
//      2026.10.18 Discovery helpers, busy port holder.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "pfs/lanseek/discovery/manager.hpp"
#include <pfs/countdown_timer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tools {

#ifdef DOCTEST_VERSION
// See https://github.com/doctest/doctest/issues/345
inline char const * current_doctest_name ()
{
    return doctest::detail::g_cs->currentTest->m_name;
}
#endif

inline void sleep_ms (int timeout, std::string const & description = std::string{})
{
    if (!description.empty())
        LOGD("", "{}: waiting for {} milliseconds", description, timeout);

    std::this_thread::sleep_for(std::chrono::milliseconds{timeout});
}

inline bool wait_atomic_bool (std::atomic_bool & flag
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (!flag.load() && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return flag.load();
}

template <typename AtomicCounter>
bool wait_atomic_counter (AtomicCounter & counter
    , typename AtomicCounter::value_type limit
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (counter.load() < limit && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return !(counter.load() < limit);
}

template <typename Predicate>
bool wait_until (Predicate && pred
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (!pred() && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return pred();
}

/**
 * Occupies UDP port on any address without address reuse, so that any other
 * attempt to bind the port fails.
 */
class port_holder
{
    int _fd {-1};

public:
    port_holder (std::uint16_t port)
    {
        _fd = ::socket(AF_INET, SOCK_DGRAM, 0);

        if (_fd < 0)
            return;

        sockaddr_in addr_in4 {};
        addr_in4.sin_family = AF_INET;
        addr_in4.sin_port = htons(port);
        addr_in4.sin_addr.s_addr = htonl(INADDR_ANY);

        if (::bind(_fd, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4)) != 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

    port_holder (port_holder const &) = delete;
    port_holder & operator = (port_holder const &) = delete;

    ~port_holder ()
    {
        if (_fd >= 0)
            ::close(_fd);
    }

    bool bound () const noexcept
    {
        return _fd >= 0;
    }
};

/**
 * Calls manager's dispatch() until at least @a limit servers delivered in total
 * or time limit exceeded.
 *
 * @return Total number of delivered servers.
 */
inline std::size_t dispatch_until (lanseek::discovery::manager & m, std::size_t limit
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};
    std::size_t total = m.dispatch();

    while (total < limit && timer.remain_count() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        total += m.dispatch();
    }

    return total;
}

} // namespace tools
