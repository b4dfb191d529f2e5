#pragma once
#include "fsremote/net/NetConfig.hpp"
#include "fsremote/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace fsremote::net {

namespace detail {

// First writer wins; the blocked caller sleeps on `settled`.
struct DeadlineRace {
    std::mutex m;
    std::condition_variable settled;
    bool finished = false;
    error_code outcome = asio::error::would_block;

    template <typename OnWin>
    bool settle(const error_code& ec, OnWin&& onWin) {
        {
            std::lock_guard<std::mutex> lock(m);
            if (finished) {
                return false;
            }
            outcome = ec;
            finished = true;
            onWin();
        }
        settled.notify_one();
        return true;
    }

    error_code await() {
        std::unique_lock<std::mutex> lock(m);
        settled.wait(lock, [this]{ return finished; });
        return outcome;
    }
};

} // namespace detail

/**
 * @brief Block the calling thread on an async operation, bounded by a timer.
 *
 * The operation and an `asio::steady_timer` are started on @p ex; whichever
 * finishes first wins. On timeout @p cancel runs (while the caller is still
 * blocked) and the result is `asio::error::timed_out`.
 *
 * The io_context behind @p ex must be running on another thread; calling this
 * from that thread deadlocks. Handlers share ownership of the race state, so a
 * completion arriving after return is harmless.
 */
template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    auto race = std::make_shared<detail::DeadlineRace>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    start_async([race, timer](const error_code& ec, auto&&... /*result*/) {
        if (race->settle(ec, []{})) {
            timer->cancel();
        }
    });

    timer->expires_after(timeout);
    timer->async_wait([race, timer, cancel, timeout](const error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (race->settle(asio::error::timed_out, cancel)) {
            logDebug("[with_deadline] gave up after ", timeout.count(), "ms\n");
        }
    });

    return race->await();
}

} // namespace fsremote::net
