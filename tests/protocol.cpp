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
#include "pfs/lanseek/discovery/protocol.hpp"
#include <string>

using lanseek::discovery::protocol;

TEST_CASE("probe") {
    std::string secret {"MyGame"};
    auto probe = protocol::make_probe(secret);

    CHECK_EQ(std::string(probe.data(), probe.size()), secret);
    CHECK(protocol::is_valid_probe(secret, probe.data(), probe.size()));

    CHECK_FALSE(protocol::is_valid_probe(secret, "MyGam", 5));
    CHECK_FALSE(protocol::is_valid_probe(secret, "MyGame!", 7));
    CHECK_FALSE(protocol::is_valid_probe(secret, "OtherG", 6));
    CHECK_FALSE(protocol::is_valid_probe(secret, "", 0));
    CHECK_FALSE(protocol::is_valid_probe(std::string{}, "", 0));
}

TEST_CASE("probe with non-ASCII secret") {
    std::string secret {"\xD0\xB8\xD0\xB3\xD1\x80\xD0\xB0"}; // utf-8 encoded
    auto probe = protocol::make_probe(secret);

    CHECK_EQ(probe.size(), 8);
    CHECK(protocol::is_valid_probe(secret, probe.data(), probe.size()));
}

TEST_CASE("acknowledgment") {
    auto ack = protocol::make_ack();

    REQUIRE_EQ(ack.size(), protocol::ACK_SIZE);
    CHECK_EQ(ack[0], protocol::ACK_VALUE);
    CHECK(protocol::is_valid_ack(ack.data(), ack.size()));

    char const zero = '\x00';
    CHECK_FALSE(protocol::is_valid_ack(& zero, 1));
    CHECK_FALSE(protocol::is_valid_ack("\x01\x01", 2));
    CHECK_FALSE(protocol::is_valid_ack("", 0));
}
