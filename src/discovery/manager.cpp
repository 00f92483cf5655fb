////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/manager.hpp"
#include "pfs/lanseek/discovery/tag.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

static searcher::options make_searcher_options (options const & opts)
{
    searcher::options result;
    result.secret = opts.secret;
    result.target_saddr = socket4_addr{opts.target_addr, opts.port};
    result.interval = opts.interval;
    result.timeout = opts.timeout;
    result.single_result = opts.single_result;
    return result;
}

manager::manager (host_interface & host, options const & opts)
    : _host(host)
    , _opts(normalize(opts))
    , _advertiser(_opts.secret, socket4_addr{_opts.listener_addr, _opts.port}, _opts.timeout)
    , _searcher(make_searcher_options(_opts))
{
    _searcher.on_server_found = [this] (socket4_addr const & saddr) {
        auto session = _session.load();

        _delivery_queue.push([this, saddr, session] {
            if (session != _session.load()) {
                LOGD(DISCOVERY_TAG, "server from previous search session discarded: {}"
                    , to_string(saddr));
                return;
            }

            ++_delivered;

            callback_t<void (socket4_addr const &)> f;

            {
                std::lock_guard<std::mutex> locker{_callback_mtx};
                f = _on_server_found;
            }

            if (f)
                f(saddr);
        });
    };

    if (_opts.automatic) {
        _host.add_listener(this);

        if (_host.is_server_active())
            start_advertising();
        else if (!_host.is_client_active())
            start_searching();
    }
}

manager::~manager ()
{
    if (_opts.automatic)
        _host.remove_listener(this);

    stop();
}

void manager::start_advertising ()
{
    if (!_host.is_server_active()) {
        LOGW(DISCOVERY_TAG, "{}", tr::_("unable to start advertising server: server is inactive"));
        return;
    }

    if (_advertiser.is_advertising()) {
        LOGI(DISCOVERY_TAG, "server is already being advertised");
        return;
    }

    if (_opts.port == _host.primary_transport_port()) {
        LOGW(DISCOVERY_TAG, "{}", tr::f_("unable to start advertising server: discovery port {}"
            " conflicts with transport port", _opts.port));
        return;
    }

    // Only one role at a time
    if (_searcher.is_searching()) {
        LOGI(DISCOVERY_TAG, "stop searching for servers: host acts as server");
        _searcher.stop();
    }

    error err;

    if (!_advertiser.start(& err))
        LOGE(DISCOVERY_TAG, "{}", err.what());
}

void manager::stop_advertising ()
{
    _advertiser.stop();
}

void manager::start_searching ()
{
    if (_host.is_server_active()) {
        LOGW(DISCOVERY_TAG, "{}", tr::_("unable to start searching for servers: server is active"));
        return;
    }

    if (_host.is_client_active()) {
        LOGW(DISCOVERY_TAG, "{}", tr::_("unable to start searching for servers: client is active"));
        return;
    }

    if (_searcher.is_searching()) {
        LOGI(DISCOVERY_TAG, "already searching for servers");
        return;
    }

    // New search session
    ++_session;

    error err;

    if (!_searcher.start(& err))
        LOGE(DISCOVERY_TAG, "{}", err.what());
}

void manager::stop_searching ()
{
    _searcher.stop();
}

void manager::stop ()
{
    _advertiser.stop();
    _searcher.stop();
}

std::size_t manager::dispatch ()
{
    auto before = _delivered;
    _delivery_queue.call_all();
    return _delivered - before;
}

void manager::server_state_changed (connection_state state)
{
    LOGD(DISCOVERY_TAG, "server state changed: {}", to_string(state));

    switch (state) {
        case connection_state::started:
            start_advertising();
            break;
        case connection_state::stopped:
            stop_advertising();
            start_searching();
            break;
        default:
            break;
    }
}

void manager::client_state_changed (connection_state state)
{
    LOGD(DISCOVERY_TAG, "client state changed: {}", to_string(state));

    switch (state) {
        case connection_state::started:
            stop_searching();
            break;
        case connection_state::stopped:
            start_searching();
            break;
        default:
            break;
    }
}

} // namespace discovery

LANSEEK__NAMESPACE_END
