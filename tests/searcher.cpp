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
#include "tools.hpp"
#include "pfs/lanseek/discovery/advertiser.hpp"
#include "pfs/lanseek/discovery/searcher.hpp"
#include "pfs/lanseek/posix/poll_poller.hpp"
#include "pfs/lanseek/posix/udp_receiver.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

using lanseek::discovery::advertiser;
using lanseek::discovery::searcher;

static lanseek::inet4_addr const LOCALHOST {127, 0, 0, 1};
static lanseek::inet4_addr const ANY_ADDR {lanseek::inet4_addr::any_addr_value};

static searcher::options make_options (std::string const & secret, std::uint16_t port)
{
    searcher::options opts;
    opts.secret = secret;
    opts.target_saddr = lanseek::socket4_addr{LOCALHOST, port};
    opts.interval = std::chrono::milliseconds{20};
    opts.timeout = std::chrono::milliseconds{200};
    return opts;
}

TEST_CASE("search without servers") {
    searcher s {make_options("MyGame", 47711)};
    std::atomic_int found_counter {0};

    s.on_server_found = [& found_counter] (lanseek::socket4_addr const &) {
        ++found_counter;
    };

    CHECK_FALSE(s.is_searching());
    REQUIRE(s.start());
    CHECK(s.is_searching());

    tools::sleep_ms(500, "search without servers");

    // Keeps searching through timeouts
    CHECK(s.is_searching());
    CHECK_EQ(found_counter.load(), 0);
    CHECK(s.discovered().empty());

    s.stop();
    CHECK_EQ(s.state(), searcher::state_enum::idle);

    // Stop while idle does nothing
    s.stop();
    CHECK_EQ(s.state(), searcher::state_enum::idle);
}

TEST_CASE("find server once") {
    std::uint16_t port = 47712;
    advertiser adv {"MyGame", lanseek::socket4_addr{ANY_ADDR, port}, std::chrono::milliseconds{2000}};
    REQUIRE(adv.start());

    searcher s {make_options("MyGame", port)};
    std::atomic_int found_counter {0};
    std::mutex found_mtx;
    std::vector<lanseek::socket4_addr> found;

    s.on_server_found = [&] (lanseek::socket4_addr const & saddr) {
        std::lock_guard<std::mutex> locker{found_mtx};
        found.push_back(saddr);
        ++found_counter;
    };

    REQUIRE(s.start());

    // Already searching
    CHECK(s.start());

    CHECK(tools::wait_atomic_counter(found_counter, 1));

    // Many more probes are answered but the server is reported once
    REQUIRE(tools::wait_until([& adv] { return adv.acks_sent() >= 5; }));
    tools::sleep_ms(100);

    CHECK_EQ(found_counter.load(), 1);
    CHECK(s.is_searching());

    {
        std::lock_guard<std::mutex> locker{found_mtx};
        REQUIRE_EQ(found.size(), 1);
        CHECK_EQ(found[0], (lanseek::socket4_addr{LOCALHOST, port}));
    }

    auto discovered = s.discovered();
    REQUIRE_EQ(discovered.size(), 1);
    CHECK_EQ(discovered[0], (lanseek::socket4_addr{LOCALHOST, port}));

    s.stop();
    adv.stop();
}

TEST_CASE("new session reports servers again") {
    std::uint16_t port = 47713;
    advertiser adv {"MyGame", lanseek::socket4_addr{ANY_ADDR, port}, std::chrono::milliseconds{2000}};
    REQUIRE(adv.start());

    searcher s {make_options("MyGame", port)};
    std::atomic_int found_counter {0};

    s.on_server_found = [& found_counter] (lanseek::socket4_addr const &) {
        ++found_counter;
    };

    REQUIRE(s.start());
    CHECK(tools::wait_atomic_counter(found_counter, 1));
    s.stop();

    // Discovered servers of the last session are still available
    CHECK_EQ(s.discovered().size(), 1);

    REQUIRE(s.start());
    CHECK(tools::wait_atomic_counter(found_counter, 2));
    CHECK_EQ(s.discovered().size(), 1);

    s.stop();
    adv.stop();
}

TEST_CASE("single result") {
    std::uint16_t port = 47714;
    advertiser adv {"MyGame", lanseek::socket4_addr{ANY_ADDR, port}, std::chrono::milliseconds{2000}};
    REQUIRE(adv.start());

    auto opts = make_options("MyGame", port);
    opts.single_result = true;

    searcher s {opts};
    std::atomic_int found_counter {0};

    s.on_server_found = [& found_counter] (lanseek::socket4_addr const &) {
        ++found_counter;
    };

    REQUIRE(s.start());
    CHECK(tools::wait_atomic_counter(found_counter, 1));
    CHECK(tools::wait_until([& s] { return !s.is_searching(); }));
    CHECK_EQ(found_counter.load(), 1);

    // Restart after the loop finished by itself
    REQUIRE(s.start());
    CHECK(tools::wait_atomic_counter(found_counter, 2));
    CHECK(tools::wait_until([& s] { return !s.is_searching(); }));

    adv.stop();
}

TEST_CASE("stop from server found callback") {
    std::uint16_t port = 47715;
    advertiser adv {"MyGame", lanseek::socket4_addr{ANY_ADDR, port}, std::chrono::milliseconds{2000}};
    REQUIRE(adv.start());

    searcher s {make_options("MyGame", port)};
    std::atomic_bool found_flag {false};

    s.on_server_found = [& s, & found_flag] (lanseek::socket4_addr const &) {
        s.stop();
        found_flag = true;
    };

    REQUIRE(s.start());
    CHECK(tools::wait_atomic_bool(found_flag));
    CHECK(tools::wait_until([& s] { return !s.is_searching(); }));

    adv.stop();
}

TEST_CASE("mismatched secret") {
    std::uint16_t port = 47716;
    advertiser adv {"MyGame", lanseek::socket4_addr{ANY_ADDR, port}, std::chrono::milliseconds{2000}};
    REQUIRE(adv.start());

    searcher s {make_options("OtherGame", port)};
    std::atomic_int found_counter {0};

    s.on_server_found = [& found_counter] (lanseek::socket4_addr const &) {
        ++found_counter;
    };

    REQUIRE(s.start());
    REQUIRE(tools::wait_until([& adv] { return adv.probes_rejected() >= 3; }));
    tools::sleep_ms(100);

    CHECK_EQ(found_counter.load(), 0);
    CHECK_EQ(adv.acks_sent(), 0);
    CHECK(adv.is_advertising());
    CHECK(s.is_searching());

    s.stop();
    adv.stop();
}

TEST_CASE("bad acknowledgment ignored") {
    std::uint16_t port = 47717;
    lanseek::posix::udp_receiver fake_server {lanseek::socket4_addr{LOCALHOST, port}};

    auto opts = make_options("MyGame", port);
    opts.interval = std::chrono::milliseconds{50};
    opts.timeout = std::chrono::milliseconds{2000};

    searcher s {opts};
    std::atomic_int found_counter {0};

    s.on_server_found = [& found_counter] (lanseek::socket4_addr const &) {
        ++found_counter;
    };

    // Waits for the next probe and answers it with @a reply
    auto answer_probe = [& fake_server] (std::string const & reply) {
        lanseek::posix::poll_poller poller;
        poller.add_socket(fake_server.id());
        REQUIRE_GT(poller.poll(std::chrono::milliseconds{3000}), 0);

        char buffer[64];
        lanseek::socket4_addr sender;
        auto n = fake_server.recv_from(buffer, sizeof(buffer), & sender);
        REQUIRE_EQ(n, 6);
        CHECK_EQ(std::string(buffer, 6), std::string{"MyGame"});

        auto res = fake_server.send_to(sender, reply.data(), static_cast<int>(reply.size()));
        CHECK_EQ(res.state, lanseek::send_status::good);
    };

    REQUIRE(s.start());

    answer_probe(std::string{"\x00", 1});
    answer_probe(std::string{"\x01\x01", 2});
    tools::sleep_ms(100);
    CHECK_EQ(found_counter.load(), 0);
    CHECK(s.is_searching());

    answer_probe(std::string{"\x01", 1});
    CHECK(tools::wait_atomic_counter(found_counter, 1));

    s.stop();
}
