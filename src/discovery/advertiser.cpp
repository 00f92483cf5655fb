////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/advertiser.hpp"
#include "pfs/lanseek/discovery/protocol.hpp"
#include "pfs/lanseek/discovery/tag.hpp"
#include "pfs/lanseek/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <pfs/memory.hpp>
#include <exception>
#include <utility>
#include <vector>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

// Enough for the longest secret
static constexpr int RECEIVE_BUFFER_SIZE = 1500;

advertiser::advertiser (std::string const & secret, socket4_addr const & listener_saddr
    , std::chrono::milliseconds timeout)
    : interruptable()
    , _secret(secret)
    , _listener_saddr(listener_saddr)
    , _timeout(timeout)
{}

advertiser::~advertiser ()
{
    stop();
}

bool advertiser::start (error * perr)
{
    std::lock_guard<std::mutex> control_locker{_control_mtx};

    {
        std::lock_guard<std::mutex> locker{_mtx};

        if (_state == state_enum::advertising) {
            LOGD(DISCOVERY_TAG, "already advertising");
            return true;
        }
    }

    // The loop could finish by itself (failure), release the thread
    if (_worker.joinable())
        _worker.join();

    std::unique_ptr<posix::udp_receiver> sock;

    try {
        sock = pfs::make_unique<posix::udp_receiver>(_listener_saddr);
    } catch (error const & ex) {
        pfs::throw_or(perr, error {
              ex.code()
            , tr::f_("start advertising failure: {}", ex.what())
        });

        return false;
    }

    {
        std::lock_guard<std::mutex> locker{_mtx};
        _socket = std::move(sock);
        _state = state_enum::advertising;
    }

    clear_interrupted();
    _worker = std::thread{& advertiser::run, this};

    return true;
}

void advertiser::stop ()
{
    std::lock_guard<std::mutex> control_locker{_control_mtx};

    {
        std::lock_guard<std::mutex> locker{_mtx};

        if (_state == state_enum::idle && !_worker.joinable())
            return;

        interrupt();

        // Wake up the loop waiting for datagrams
        if (_socket)
            _socket->shutdown();
    }

    if (_worker.joinable())
        _worker.join();

    std::lock_guard<std::mutex> locker{_mtx};
    _socket.reset();
    _state = state_enum::idle;
}

advertiser::state_enum advertiser::state () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _state;
}

socket4_addr advertiser::bound_addr () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _socket ? _socket->saddr() : _listener_saddr;
}

bool advertiser::reset_socket ()
{
    std::lock_guard<std::mutex> locker{_mtx};

    if (interrupted())
        return false;

    // Close before bind to the same port
    _socket.reset();
    _socket = pfs::make_unique<posix::udp_receiver>(_listener_saddr);

    return true;
}

void advertiser::process_probe (socket4_addr const & sender, char const * data, std::size_t size)
{
    ++_probes_received;

    if (!protocol::is_valid_probe(_secret, data, size)) {
        ++_probes_rejected;
        LOGW(DISCOVERY_TAG, "{}", tr::f_("bad probe received from: {} ({} bytes), dropped"
            , to_string(sender), size));
        return;
    }

    auto ack = protocol::make_ack();
    error err;
    auto res = _socket->send_to(sender, ack.data(), static_cast<int>(ack.size()), & err);

    if (res.state == send_status::good) {
        ++_acks_sent;
        LOGD(DISCOVERY_TAG, "acknowledgment sent to: {}", to_string(sender));
    } else if (res.state == send_status::failure || res.state == send_status::network) {
        LOGW(DISCOVERY_TAG, "{}", tr::f_("send acknowledgment failure: {}", err.what()));
    } else {
        LOGW(DISCOVERY_TAG, "{}", tr::f_("acknowledgment to {} dropped: send buffer is full"
            , to_string(sender)));
    }
}

void advertiser::run ()
{
    LOGI(DISCOVERY_TAG, "started advertising on: {}", to_string(bound_addr()));

    std::vector<char> buffer(RECEIVE_BUFFER_SIZE);

    try {
        while (!interrupted()) {
            posix::poll_poller poller;
            poller.add_socket(_socket->id());

            auto n = poller.poll(_timeout);

            if (interrupted())
                break;

            // Timeout, recreate the socket and wait again
            if (n == 0) {
                LOGD(DISCOVERY_TAG, "no probes for {} ms, reset advertising socket", _timeout.count());

                if (!reset_socket())
                    break;

                continue;
            }

            if (poller.hangup(_socket->id())) {
                LOGE(DISCOVERY_TAG, "{}", tr::_("advertising socket shut down unexpectedly"));
                break;
            }

            socket4_addr sender;
            int size = 0;

            while (!interrupted()
                    && (size = _socket->recv_from(buffer.data(), RECEIVE_BUFFER_SIZE, & sender)) >= 0) {
                process_probe(sender, buffer.data(), static_cast<std::size_t>(size));
            }
        }
    } catch (error const & ex) {
        LOGE(DISCOVERY_TAG, "{}", tr::f_("advertising failure: {}", ex.what()));
    } catch (std::exception const & ex) {
        LOGE(DISCOVERY_TAG, "{}", tr::f_("advertising failure: unexpected exception: {}", ex.what()));
    }

    std::lock_guard<std::mutex> locker{_mtx};
    _socket.reset();
    _state = state_enum::idle;

    if (interrupted())
        LOGI(DISCOVERY_TAG, "stopped advertising");
    else
        LOGW(DISCOVERY_TAG, "advertising loop terminated");
}

} // namespace discovery

LANSEEK__NAMESPACE_END
