////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../callback.hpp"
#include "../error.hpp"
#include "../exports.hpp"
#include "../inet4_addr.hpp"
#include "../interruptable.hpp"
#include "../namespace.hpp"
#include "../send_result.hpp"
#include "../socket4_addr.hpp"
#include "../posix/udp_sender.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

/**
 * Periodically sends probes and collects acknowledgment senders.
 *
 * @details The search loop runs in a dedicated thread. Each iteration waits
 *          for @c interval, sends the probe to the target address and waits
 *          for acknowledgments at most @c timeout. On timeout the socket is
 *          recreated and the next iteration begins.
 *
 *          Each responding address is reported once per search session
 *          (from start() to stop()). In single result mode the loop finishes
 *          after the first server is reported.
 *
 *          @c on_server_found is invoked in the search loop thread.
 */
class searcher: public interruptable
{
public:
    enum class state_enum { idle, searching };

    struct options
    {
        std::string secret;
        socket4_addr target_saddr;
        std::chrono::milliseconds interval {1000};
        std::chrono::milliseconds timeout {2000};
        bool single_result {false};
    };

private:
    options _opts;

    // Serializes start() and stop() calls
    std::mutex _control_mtx;

    // Protects state, socket replacement and discovered peers snapshot
    mutable std::mutex _mtx;
    state_enum _state {state_enum::idle};
    std::unique_ptr<posix::udp_sender> _socket;
    std::thread _worker;
    std::thread::id _loop_id;

    // Addresses reported in the current session, accessed by the loop only
    std::set<inet4_addr> _reported;

    std::vector<socket4_addr> _discovered;

    // Don't report the same send failure every iteration
    send_status _last_send_status {send_status::good};

public:
    callback_t<void (socket4_addr const &)> on_server_found = [] (socket4_addr const &) {};

public:
    LANSEEK__EXPORT searcher (options const & opts);

    searcher (searcher const &) = delete;
    searcher (searcher &&) = delete;
    searcher & operator = (searcher const &) = delete;
    searcher & operator = (searcher &&) = delete;

    LANSEEK__EXPORT ~searcher ();

public:
    /**
     * Starts new search session: clears discovered servers, creates the
     * socket and launches the search loop. Does nothing if already searching.
     *
     * @return @c false if the socket could not be created.
     */
    LANSEEK__EXPORT bool start (error * perr = nullptr);

    /**
     * Stops the search loop and releases the socket. Does nothing if idle.
     * When called from @c on_server_found the loop is only requested to
     * finish.
     */
    LANSEEK__EXPORT void stop ();

    LANSEEK__EXPORT state_enum state () const;

    bool is_searching () const
    {
        return state() == state_enum::searching;
    }

    /**
     * Servers reported in the current (or last) search session in order of discovery.
     */
    LANSEEK__EXPORT std::vector<socket4_addr> discovered () const;

private:
    void run ();
    bool reset_socket ();
    void send_probe (std::vector<char> const & probe);

    /**
     * @return @c true if the search must be finished.
     */
    bool process_reply (socket4_addr const & sender, char const * data, std::size_t size);
};

} // namespace discovery

LANSEEK__NAMESPACE_END
