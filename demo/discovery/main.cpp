////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2025.03.17 Initial version.
//      2026.10.18 Advertise/search roles.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/startup.hpp"
#include "pfs/lanseek/discovery/host.hpp"
#include "pfs/lanseek/discovery/manager.hpp"
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <signal.h>

using lanseek::discovery::connection_state;

static std::atomic_bool s_finish_flag {false};

static void sigterm_handler (int)
{
    s_finish_flag = true;
}

void print_usage (pfs::filesystem::path const & programName
    , std::string const & errorString = std::string{})
{
    std::FILE * out = stdout;

    if (!errorString.empty()) {
        out = stderr;
        fmt::print(out, "Error: {}\n", errorString);
    }

    fmt::print(out, "Usage:\n\n"
        "{0} --help | -h\n"
        "\tPrint this help and exit\n\n"
        "{0} --advertise | --search [--secret=SECRET] [--port=PORT] [--interval=MS]\n"
        "\t[--timeout=MS] [--target=ADDR] [--transport-port=PORT] [--single] [--auto]\n\n"
        "--advertise\n"
        "\tAct as a server and answer probes\n"
        "--search\n"
        "\tSearch for servers\n"
        "--secret=SECRET\n"
        "\tShared secret. Default is \"lanseek\"\n"
        "--port=PORT\n"
        "\tDiscovery port. Default is 42044\n"
        "--interval=MS\n"
        "\tProbe interval in milliseconds. Default is 1000\n"
        "--timeout=MS\n"
        "\tReceive timeout in milliseconds. Default is 2000\n"
        "--target=ADDR\n"
        "\tProbe destination address. Default is 255.255.255.255\n"
        "--transport-port=PORT\n"
        "\tHost transport port. Default is 42042\n"
        "--single\n"
        "\tStop searching after the first server found\n"
        "--auto\n"
        "\tFollow host connection state\n"
        , programName);
}

static bool parse_port (std::string const & text, std::uint16_t & port)
{
    std::error_code ec;
    port = pfs::to_integer(text.begin(), text.end(), std::uint16_t{1}, std::uint16_t{65535}, ec);
    return !ec;
}

static bool parse_millis (std::string const & text, std::chrono::milliseconds & millis)
{
    std::error_code ec;
    auto n = pfs::to_integer(text.begin(), text.end(), 0, 3600000, ec);

    if (ec)
        return false;

    millis = std::chrono::milliseconds{n};
    return true;
}

int main (int argc, char * argv[])
{
    lanseek::startup_guard lanseek_startup;

    lanseek::discovery::options opts;
    opts.secret = "lanseek";
    opts.port = 42044;

    std::uint16_t transport_port = 42042;
    bool advertise = false;
    bool search = false;

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    if (!commandLineIterator.has_more()) {
        print_usage(programName);
        return EXIT_SUCCESS;
    }

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("advertise")) {
            advertise = true;
        } else if (x.is_option("search")) {
            search = true;
        } else if (x.is_option("single")) {
            opts.single_result = true;
        } else if (x.is_option("auto")) {
            opts.automatic = true;
        } else if (x.is_option("secret")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected secret");
                return EXIT_FAILURE;
            }

            opts.secret = pfs::to_string(x.arg());
        } else if (x.is_option("port") || x.is_option("transport-port")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected port");
                return EXIT_FAILURE;
            }

            auto & port = x.is_option("port") ? opts.port : transport_port;

            if (!parse_port(pfs::to_string(x.arg()), port)) {
                fmt::print(stderr, "Bad port\n");
                return EXIT_FAILURE;
            }
        } else if (x.is_option("interval") || x.is_option("timeout")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected duration in milliseconds");
                return EXIT_FAILURE;
            }

            auto & millis = x.is_option("interval") ? opts.interval : opts.timeout;

            if (!parse_millis(pfs::to_string(x.arg()), millis)) {
                fmt::print(stderr, "Bad duration\n");
                return EXIT_FAILURE;
            }
        } else if (x.is_option("target")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected target address");
                return EXIT_FAILURE;
            }

            auto addr = lanseek::inet4_addr::parse(pfs::to_string(x.arg()));

            if (!addr) {
                fmt::print(stderr, "Bad target address\n");
                return EXIT_FAILURE;
            }

            opts.target_addr = *addr;
        } else {
            fmt::print(stderr, "Bad arguments. Try --help option.\n");
            return EXIT_FAILURE;
        }
    }

    if (advertise == search) {
        print_usage(programName, "Exactly one of --advertise or --search must be specified");
        return EXIT_FAILURE;
    }

    signal(SIGINT, sigterm_handler);
    signal(SIGTERM, sigterm_handler);

    lanseek::discovery::basic_host host {transport_port};

    // The server must be active before the advertiser is allowed to start
    if (advertise && !opts.automatic)
        host.set_server_state(connection_state::started);

    try {
        lanseek::discovery::manager discovery {host, opts};
        std::set<lanseek::socket4_addr> servers;

        discovery.on_server_found([& servers] (lanseek::socket4_addr const & saddr) {
            if (servers.insert(saddr).second)
                fmt::print("Server found: {}\n", to_string(saddr));
        });

        if (opts.automatic) {
            // Host lifecycle drives the roles
            if (advertise) {
                host.set_server_state(connection_state::starting);
                host.set_server_state(connection_state::started);
            }
        } else if (advertise) {
            discovery.start_advertising();
        } else {
            discovery.start_searching();
        }

        while (!s_finish_flag) {
            discovery.dispatch();

            if (search && opts.single_result && !servers.empty() && !discovery.is_searching())
                break;

            if (advertise && !discovery.is_advertising()) {
                LOGE("", "Advertising is not active, exit");
                return EXIT_FAILURE;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        discovery.stop();
    } catch (lanseek::error const & ex) {
        LOGE("", "{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
