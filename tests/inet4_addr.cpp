////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2021-2026 Vladislav Trifochkin
//
// License: see LICENSE file
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.16 Initial version.
//      2026.10.18 Parsing and socket addresses.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "pfs/lanseek/inet4_addr.hpp"
#include "pfs/lanseek/socket4_addr.hpp"
#include <set>

TEST_CASE("inet4_addr") {
    lanseek::inet4_addr unicast {192, 168, 1, 1};
    lanseek::inet4_addr multicast_low {224, 0, 0, 0};
    lanseek::inet4_addr multicast_hi {239, 255, 255, 255};
    lanseek::inet4_addr broadcast_global {255, 255, 255, 255};
    lanseek::inet4_addr broadcast {192, 168, 1, 255};
    lanseek::inet4_addr loopback {127, 0, 0, 1};

    CHECK_FALSE(lanseek::is_broadcast(unicast));
    CHECK_FALSE(lanseek::is_broadcast(multicast_low));
    CHECK_FALSE(lanseek::is_broadcast(multicast_hi));
    CHECK(lanseek::is_broadcast(broadcast_global));
    CHECK(lanseek::is_broadcast(broadcast));

    CHECK_FALSE(lanseek::is_multicast(unicast));
    CHECK(lanseek::is_multicast(multicast_low));
    CHECK(lanseek::is_multicast(multicast_hi));
    CHECK_FALSE(lanseek::is_multicast(broadcast_global));
    CHECK_FALSE(lanseek::is_multicast(broadcast));

    CHECK(lanseek::is_loopback(loopback));
    CHECK_FALSE(lanseek::is_loopback(unicast));

    CHECK_EQ(static_cast<std::uint32_t>(broadcast_global), lanseek::inet4_addr::broadcast_addr_value);
    CHECK_EQ(static_cast<std::uint32_t>(lanseek::inet4_addr{}), lanseek::inet4_addr::any_addr_value);
    CHECK_EQ(static_cast<std::uint32_t>(loopback), 0x7F000001);
}

TEST_CASE("inet4_addr parse") {
    auto a1 = lanseek::inet4_addr::parse("192.168.1.1");
    REQUIRE(a1);
    CHECK_EQ(*a1, (lanseek::inet4_addr{192, 168, 1, 1}));

    auto a2 = lanseek::inet4_addr::parse(std::string{"255.255.255.255"});
    REQUIRE(a2);
    CHECK(lanseek::is_broadcast(*a2));

    auto a3 = lanseek::inet4_addr::parse("0.0.0.0");
    REQUIRE(a3);
    CHECK_EQ(*a3, (lanseek::inet4_addr{lanseek::inet4_addr::any_addr_value}));

    CHECK_FALSE(lanseek::inet4_addr::parse(""));
    CHECK_FALSE(lanseek::inet4_addr::parse("192.168.1"));
    CHECK_FALSE(lanseek::inet4_addr::parse("192.168..1"));
    CHECK_FALSE(lanseek::inet4_addr::parse("256.0.0.1"));
    CHECK_FALSE(lanseek::inet4_addr::parse("1.2.3.1000"));
    CHECK_FALSE(lanseek::inet4_addr::parse("a.b.c.d"));
    CHECK_FALSE(lanseek::inet4_addr::parse("localhost"));
}

TEST_CASE("inet4_addr to_string") {
    CHECK_EQ(to_string(lanseek::inet4_addr{127, 0, 0, 1}), std::string{"127.0.0.1"});
    CHECK_EQ(to_string(lanseek::inet4_addr{lanseek::inet4_addr::broadcast_addr_value})
        , std::string{"255.255.255.255"});
    CHECK_EQ(to_string(lanseek::inet4_addr{10, 0, 20, 3}), std::string{"10.0.20.3"});
}

TEST_CASE("socket4_addr") {
    auto s1 = lanseek::socket4_addr::parse("192.168.1.10:42044");
    REQUIRE(s1);
    CHECK_EQ(s1->addr, (lanseek::inet4_addr{192, 168, 1, 10}));
    CHECK_EQ(s1->port, 42044);
    CHECK_EQ(to_string(*s1), std::string{"192.168.1.10:42044"});

    CHECK_FALSE(lanseek::socket4_addr::parse("192.168.1.10"));
    CHECK_FALSE(lanseek::socket4_addr::parse("192.168.1.10:"));
    CHECK_FALSE(lanseek::socket4_addr::parse("192.168.1.10:0"));
    CHECK_FALSE(lanseek::socket4_addr::parse("192.168.1.10:65536"));
    CHECK_FALSE(lanseek::socket4_addr::parse("192.168.1:80"));

    lanseek::socket4_addr a {lanseek::inet4_addr{10, 0, 0, 1}, 80};
    lanseek::socket4_addr b {lanseek::inet4_addr{10, 0, 0, 1}, 81};
    lanseek::socket4_addr c {lanseek::inet4_addr{10, 0, 0, 2}, 80};

    CHECK(a != b);
    CHECK(a < b);
    CHECK(b < c);

    std::set<lanseek::socket4_addr> endpoints {a, b, c, a};
    CHECK_EQ(endpoints.size(), 3);
}
