////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2025.08.08 Initial version.
//      2026.10.18 Added interruptible wait.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

LANSEEK__NAMESPACE_BEGIN

class interruptable
{
private:
    std::atomic_bool _interrupted {false};
    std::mutex _wait_mtx;
    std::condition_variable _wait_cv;

public:
    void interrupt ()
    {
        {
            std::lock_guard<std::mutex> locker{_wait_mtx};
            _interrupted.store(true);
        }

        _wait_cv.notify_all();
    }

    bool interrupted () const noexcept
    {
        return _interrupted.load();
    }

    void clear_interrupted ()
    {
        _interrupted.store(false);
    }

    /**
     * Sleeps for @a timeout or until interrupted.
     *
     * @return @c false if interrupted.
     */
    template <typename Rep, typename Period>
    bool wait_for (std::chrono::duration<Rep, Period> const & timeout)
    {
        std::unique_lock<std::mutex> locker{_wait_mtx};
        return !_wait_cv.wait_for(locker, timeout, [this] { return _interrupted.load(); });
    }
};

LANSEEK__NAMESPACE_END
