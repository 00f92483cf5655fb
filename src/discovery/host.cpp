////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/host.hpp"
#include <algorithm>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

std::string to_string (connection_state state)
{
    switch (state) {
        case connection_state::starting: return "starting";
        case connection_state::started:  return "started";
        case connection_state::stopping: return "stopping";
        case connection_state::stopped:  return "stopped";
    }

    return "unknown";
}

basic_host::basic_host (std::uint16_t transport_port)
    : _transport_port(transport_port)
{}

basic_host::~basic_host () = default;

bool basic_host::is_server_active () const
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};
    return _server_state == connection_state::started;
}

bool basic_host::is_client_active () const
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};
    return _client_state == connection_state::started;
}

std::uint16_t basic_host::primary_transport_port () const
{
    return _transport_port;
}

void basic_host::add_listener (host_listener * listener)
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};

    auto pos = std::find(_listeners.begin(), _listeners.end(), listener);

    if (pos == _listeners.end())
        _listeners.push_back(listener);
}

void basic_host::remove_listener (host_listener * listener)
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};

    auto pos = std::find(_listeners.begin(), _listeners.end(), listener);

    if (pos != _listeners.end())
        _listeners.erase(pos);
}

connection_state basic_host::server_state () const
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};
    return _server_state;
}

connection_state basic_host::client_state () const
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};
    return _client_state;
}

void basic_host::set_server_state (connection_state state)
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};

    if (_server_state == state)
        return;

    _server_state = state;

    // Copy: a listener may unsubscribe while being notified
    auto listeners = _listeners;

    for (auto * l: listeners)
        l->server_state_changed(state);
}

void basic_host::set_client_state (connection_state state)
{
    std::lock_guard<std::recursive_mutex> locker{_mtx};

    if (_client_state == state)
        return;

    _client_state = state;

    auto listeners = _listeners;

    for (auto * l: listeners)
        l->client_state_changed(state);
}

} // namespace discovery

LANSEEK__NAMESPACE_END
