////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../exports.hpp"
#include "../namespace.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

enum class connection_state
{
      starting
    , started
    , stopping
    , stopped
};

LANSEEK__EXPORT std::string to_string (connection_state state);

/**
 * Observer for host connection state transitions.
 */
class host_listener
{
public:
    virtual ~host_listener () {}

    virtual void server_state_changed (connection_state state) = 0;
    virtual void client_state_changed (connection_state state) = 0;
};

/**
 * Host application the discovery runs inside of.
 */
class host_interface
{
public:
    virtual ~host_interface () {}

    virtual bool is_server_active () const = 0;
    virtual bool is_client_active () const = 0;

    /**
     * Port of the host application main transport.
     */
    virtual std::uint16_t primary_transport_port () const = 0;

    virtual void add_listener (host_listener * listener) = 0;
    virtual void remove_listener (host_listener * listener) = 0;
};

/**
 * Thread-safe host that tracks server and client states set by the
 * application and broadcasts transitions to registered listeners.
 *
 * @details Listeners are notified in the calling thread under the internal
 *          lock, so a listener removed by another thread is never called after
 *          remove_listener() returns.
 */
class basic_host: public host_interface
{
    mutable std::recursive_mutex _mtx;
    std::uint16_t _transport_port {0};
    connection_state _server_state {connection_state::stopped};
    connection_state _client_state {connection_state::stopped};
    std::vector<host_listener *> _listeners;

public:
    LANSEEK__EXPORT basic_host (std::uint16_t transport_port);

    basic_host (basic_host const &) = delete;
    basic_host (basic_host &&) = delete;
    basic_host & operator = (basic_host const &) = delete;
    basic_host & operator = (basic_host &&) = delete;

    LANSEEK__EXPORT ~basic_host ();

public:
    LANSEEK__EXPORT bool is_server_active () const override;
    LANSEEK__EXPORT bool is_client_active () const override;
    LANSEEK__EXPORT std::uint16_t primary_transport_port () const override;
    LANSEEK__EXPORT void add_listener (host_listener * listener) override;
    LANSEEK__EXPORT void remove_listener (host_listener * listener) override;

    LANSEEK__EXPORT connection_state server_state () const;
    LANSEEK__EXPORT connection_state client_state () const;

    /**
     * Sets server state and notifies listeners if state changed.
     * Server is active in @c connection_state::started state only.
     */
    LANSEEK__EXPORT void set_server_state (connection_state state);

    /**
     * Sets client state and notifies listeners if state changed.
     * Client is active in @c connection_state::started state only.
     */
    LANSEEK__EXPORT void set_client_state (connection_state state);
};

} // namespace discovery

LANSEEK__NAMESPACE_END
