////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../error.hpp"
#include "../exports.hpp"
#include "../interruptable.hpp"
#include "../namespace.hpp"
#include "../socket4_addr.hpp"
#include "../posix/udp_receiver.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

/**
 * Answers probes carrying the shared secret with an acknowledgment.
 *
 * @details The advertise loop runs in a dedicated thread. Each iteration waits
 *          for datagrams at most @c timeout; on timeout the socket is
 *          recreated and waiting continues. The loop exits when stop() is
 *          called or on unexpected failure (the failure is logged and the
 *          advertiser returns to the idle state).
 */
class advertiser: public interruptable
{
public:
    enum class state_enum { idle, advertising };

private:
    std::string _secret;
    socket4_addr _listener_saddr;
    std::chrono::milliseconds _timeout;

    // Serializes start() and stop() calls
    std::mutex _control_mtx;

    // Protects state and socket replacement
    mutable std::mutex _mtx;
    state_enum _state {state_enum::idle};
    std::unique_ptr<posix::udp_receiver> _socket;
    std::thread _worker;

    std::atomic<std::uint64_t> _probes_received {0};
    std::atomic<std::uint64_t> _probes_rejected {0};
    std::atomic<std::uint64_t> _acks_sent {0};

public:
    /**
     * @param secret Probe payload to answer.
     * @param listener_saddr Address and discovery port to bind to.
     * @param timeout Receive operation limit.
     */
    LANSEEK__EXPORT advertiser (std::string const & secret, socket4_addr const & listener_saddr
        , std::chrono::milliseconds timeout);

    advertiser (advertiser const &) = delete;
    advertiser (advertiser &&) = delete;
    advertiser & operator = (advertiser const &) = delete;
    advertiser & operator = (advertiser &&) = delete;

    LANSEEK__EXPORT ~advertiser ();

public:
    /**
     * Binds the discovery socket and launches the advertise loop.
     * Does nothing if already advertising.
     *
     * @return @c false if the socket could not be created or bound.
     */
    LANSEEK__EXPORT bool start (error * perr = nullptr);

    /**
     * Stops the advertise loop and releases the socket. Does nothing if idle.
     */
    LANSEEK__EXPORT void stop ();

    LANSEEK__EXPORT state_enum state () const;

    bool is_advertising () const
    {
        return state() == state_enum::advertising;
    }

    /**
     * Returns bound socket address while advertising or configured listener
     * address otherwise.
     */
    LANSEEK__EXPORT socket4_addr bound_addr () const;

    std::uint64_t probes_received () const noexcept { return _probes_received.load(); }
    std::uint64_t probes_rejected () const noexcept { return _probes_rejected.load(); }
    std::uint64_t acks_sent () const noexcept { return _acks_sent.load(); }

private:
    void run ();
    bool reset_socket ();
    void process_probe (socket4_addr const & sender, char const * data, std::size_t size);
};

} // namespace discovery

LANSEEK__NAMESPACE_END
