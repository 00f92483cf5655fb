////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2025.03.17 Initial version.
//      2026.10.18 Role guard, delivery queue and automatic mode.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "advertiser.hpp"
#include "host.hpp"
#include "options.hpp"
#include "searcher.hpp"
#include "../callback.hpp"
#include "../exports.hpp"
#include "../namespace.hpp"
#include "../socket4_addr.hpp"
#include <pfs/function_queue.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

/**
 * Discovery manager.
 *
 * @details Guards the discovery roles: advertising is allowed only while the
 *          host acts as a server, searching only while the host is neither a
 *          server nor a client. Misuse is logged and ignored.
 *
 *          Servers found by the searcher are queued and delivered to the
 *          consumer callback by dispatch() in the consumer's thread.
 *
 *          In automatic mode the manager follows host connection state:
 *          @li server started - start advertising;
 *          @li server stopped - stop advertising, start searching;
 *          @li client started - stop searching;
 *          @li client stopped - start searching.
 */
class manager: public host_listener
{
    host_interface & _host;
    options _opts;
    advertiser _advertiser;
    searcher _searcher;

    // Servers found, waiting for dispatch
    pfs::function_queue<> _delivery_queue;

    // Search session number, servers queued by previous sessions are discarded
    std::atomic<std::size_t> _session {0};

    // Accessed from dispatch() only
    std::size_t _delivered {0};

    std::mutex _callback_mtx;
    callback_t<void (socket4_addr const &)> _on_server_found;

public:
    /**
     * @throws lanseek::error (errc::invalid_argument) on invalid options.
     */
    LANSEEK__EXPORT manager (host_interface & host, options const & opts);

    manager (manager const &) = delete;
    manager (manager &&) = delete;
    manager & operator = (manager const &) = delete;
    manager & operator = (manager &&) = delete;

    LANSEEK__EXPORT ~manager ();

public: // Set callbacks
    /**
     * Sets server found callback.
     *
     * @details Callback @a f signature must match:
     *          void (socket4_addr const &)
     *          It is invoked from dispatch() once per server address per search session.
     */
    template <typename F>
    manager & on_server_found (F && f)
    {
        std::lock_guard<std::mutex> locker{_callback_mtx};
        _on_server_found = std::forward<F>(f);
        return *this;
    }

public:
    LANSEEK__EXPORT void start_advertising ();
    LANSEEK__EXPORT void stop_advertising ();
    LANSEEK__EXPORT void start_searching ();
    LANSEEK__EXPORT void stop_searching ();

    /**
     * Stops whichever role is active.
     */
    LANSEEK__EXPORT void stop ();

    bool is_advertising () const
    {
        return _advertiser.is_advertising();
    }

    bool is_searching () const
    {
        return _searcher.is_searching();
    }

    options const & opts () const noexcept
    {
        return _opts;
    }

    socket4_addr advertising_addr () const
    {
        return _advertiser.bound_addr();
    }

    /**
     * Servers found in the current (or last) search session.
     */
    std::vector<socket4_addr> discovered () const
    {
        return _searcher.discovered();
    }

    /**
     * Delivers queued servers to the consumer callback in the calling thread.
     * Servers found by a search session preceding the current one are dropped.
     *
     * @return Number of delivered servers.
     */
    LANSEEK__EXPORT std::size_t dispatch ();

private:
    void server_state_changed (connection_state state) override;
    void client_state_changed (connection_state state) override;
};

} // namespace discovery

LANSEEK__NAMESPACE_END
