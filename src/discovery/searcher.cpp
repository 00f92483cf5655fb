////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/searcher.hpp"
#include "pfs/lanseek/discovery/protocol.hpp"
#include "pfs/lanseek/discovery/tag.hpp"
#include "pfs/lanseek/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <pfs/memory.hpp>
#include <exception>
#include <utility>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

static constexpr int RECEIVE_BUFFER_SIZE = 64;

searcher::searcher (options const & opts)
    : interruptable()
    , _opts(opts)
{}

searcher::~searcher ()
{
    stop();
}

bool searcher::start (error * perr)
{
    std::lock_guard<std::mutex> control_locker{_control_mtx};

    {
        std::lock_guard<std::mutex> locker{_mtx};

        if (_state == state_enum::searching) {
            LOGD(DISCOVERY_TAG, "already searching");
            return true;
        }
    }

    // The loop could finish by itself (single result or failure), release the thread
    if (_worker.joinable())
        _worker.join();

    std::unique_ptr<posix::udp_sender> sock;

    try {
        sock = pfs::make_unique<posix::udp_sender>();
    } catch (error const & ex) {
        pfs::throw_or(perr, error {
              ex.code()
            , tr::f_("start searching failure: {}", ex.what())
        });

        return false;
    }

    _reported.clear();
    _last_send_status = send_status::good;

    {
        std::lock_guard<std::mutex> locker{_mtx};
        _discovered.clear();
        _socket = std::move(sock);
        _state = state_enum::searching;
    }

    clear_interrupted();
    _worker = std::thread{& searcher::run, this};

    return true;
}

void searcher::stop ()
{
    {
        std::lock_guard<std::mutex> locker{_mtx};

        // Called from on_server_found, the loop will release resources by itself
        if (_loop_id == std::this_thread::get_id()) {
            interrupt();
            return;
        }
    }

    std::lock_guard<std::mutex> control_locker{_control_mtx};

    {
        std::lock_guard<std::mutex> locker{_mtx};

        if (_state == state_enum::idle && !_worker.joinable())
            return;

        interrupt();

        // Wake up the loop waiting for replies
        if (_socket)
            _socket->shutdown();
    }

    if (_worker.joinable())
        _worker.join();

    std::lock_guard<std::mutex> locker{_mtx};
    _socket.reset();
    _state = state_enum::idle;
}

searcher::state_enum searcher::state () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _state;
}

std::vector<socket4_addr> searcher::discovered () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _discovered;
}

bool searcher::reset_socket ()
{
    std::lock_guard<std::mutex> locker{_mtx};

    if (interrupted())
        return false;

    _socket = pfs::make_unique<posix::udp_sender>();
    return true;
}

void searcher::send_probe (std::vector<char> const & probe)
{
    error err;
    auto res = _socket->send_to(_opts.target_saddr, probe.data(), static_cast<int>(probe.size()), & err);

    if (res.state != _last_send_status) {
        if (res.state == send_status::failure || res.state == send_status::network) {
            LOGW(DISCOVERY_TAG, "{}", tr::f_("send probe failure: {}", err.what()));
        } else if (res.state != send_status::good) {
            LOGW(DISCOVERY_TAG, "{}", tr::f_("probe to {} dropped: send buffer is full"
                , to_string(_opts.target_saddr)));
        }
    }

    _last_send_status = res.state;
}

bool searcher::process_reply (socket4_addr const & sender, char const * data, std::size_t size)
{
    if (!protocol::is_valid_ack(data, size)) {
        LOGW(DISCOVERY_TAG, "{}", tr::f_("bad acknowledgment received from: {} ({} bytes), dropped"
            , to_string(sender), size));
        return false;
    }

    if (!_reported.insert(sender.addr).second) {
        LOGD(DISCOVERY_TAG, "server already reported: {}", to_string(sender));
        return false;
    }

    {
        std::lock_guard<std::mutex> locker{_mtx};
        _discovered.push_back(sender);
    }

    LOGI(DISCOVERY_TAG, "server found: {}", to_string(sender));

    on_server_found(sender);

    return _opts.single_result;
}

void searcher::run ()
{
    {
        std::lock_guard<std::mutex> locker{_mtx};
        _loop_id = std::this_thread::get_id();
    }

    LOGI(DISCOVERY_TAG, "started searching for servers: {}", to_string(_opts.target_saddr));

    auto probe = protocol::make_probe(_opts.secret);
    char buffer[RECEIVE_BUFFER_SIZE];
    bool finished = false;

    try {
        while (!finished && !interrupted()) {
            if (!wait_for(_opts.interval))
                break;

            send_probe(probe);

            posix::poll_poller poller;
            poller.add_socket(_socket->id());

            auto n = poller.poll(_opts.timeout);

            if (interrupted())
                break;

            // Timeout, recreate the socket and probe again
            if (n == 0) {
                LOGD(DISCOVERY_TAG, "no replies for {} ms, reset searching socket", _opts.timeout.count());

                if (!reset_socket())
                    break;

                continue;
            }

            if (poller.hangup(_socket->id())) {
                LOGE(DISCOVERY_TAG, "{}", tr::_("searching socket shut down unexpectedly"));
                break;
            }

            socket4_addr sender;
            int size = 0;

            while (!finished && !interrupted()
                    && (size = _socket->recv_from(buffer, RECEIVE_BUFFER_SIZE, & sender)) >= 0) {
                finished = process_reply(sender, buffer, static_cast<std::size_t>(size));
            }
        }
    } catch (error const & ex) {
        LOGE(DISCOVERY_TAG, "{}", tr::f_("searching failure: {}", ex.what()));
    } catch (std::exception const & ex) {
        LOGE(DISCOVERY_TAG, "{}", tr::f_("searching failure: unexpected exception: {}", ex.what()));
    }

    std::lock_guard<std::mutex> locker{_mtx};
    _socket.reset();
    _state = state_enum::idle;
    _loop_id = std::thread::id{};

    if (finished)
        LOGI(DISCOVERY_TAG, "stopped searching: server found");
    else if (interrupted())
        LOGI(DISCOVERY_TAG, "stopped searching");
    else
        LOGW(DISCOVERY_TAG, "searching loop terminated");
}

} // namespace discovery

LANSEEK__NAMESPACE_END
