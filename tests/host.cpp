////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "pfs/lanseek/discovery/host.hpp"
#include <string>
#include <vector>

using lanseek::discovery::connection_state;

class recording_listener: public lanseek::discovery::host_listener
{
public:
    std::vector<std::string> events;

public:
    void server_state_changed (connection_state state) override
    {
        events.push_back("server:" + to_string(state));
    }

    void client_state_changed (connection_state state) override
    {
        events.push_back("client:" + to_string(state));
    }
};

TEST_CASE("host state") {
    lanseek::discovery::basic_host host {7770};

    CHECK_EQ(host.primary_transport_port(), 7770);
    CHECK_FALSE(host.is_server_active());
    CHECK_FALSE(host.is_client_active());

    host.set_server_state(connection_state::starting);
    CHECK_FALSE(host.is_server_active());

    host.set_server_state(connection_state::started);
    CHECK(host.is_server_active());
    CHECK_FALSE(host.is_client_active());

    host.set_client_state(connection_state::started);
    CHECK(host.is_client_active());

    host.set_server_state(connection_state::stopping);
    CHECK_FALSE(host.is_server_active());
}

TEST_CASE("host listeners") {
    lanseek::discovery::basic_host host {7770};
    recording_listener listener;

    host.add_listener(& listener);

    host.set_server_state(connection_state::starting);
    host.set_server_state(connection_state::started);

    // Same state, no notification
    host.set_server_state(connection_state::started);

    host.set_client_state(connection_state::started);
    host.set_client_state(connection_state::stopped);

    host.remove_listener(& listener);
    host.set_server_state(connection_state::stopped);

    REQUIRE_EQ(listener.events.size(), 4);
    CHECK_EQ(listener.events[0], std::string{"server:starting"});
    CHECK_EQ(listener.events[1], std::string{"server:started"});
    CHECK_EQ(listener.events[2], std::string{"client:started"});
    CHECK_EQ(listener.events[3], std::string{"client:stopped"});
}
