#pragma once

#include "fsremote/net/NetService.hpp"

#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace fsremote::core {

/**
 * @brief One worker thread, one FIFO queue.
 *
 * Work items are posted to a dedicated `asio::io_context` driven by a single
 * thread, so they run strictly one after another in submission order. Each
 * `submit` returns a future for that item's result; an exception thrown by the
 * item is stored in its future and rethrown to the waiting caller only.
 *
 * Submitting from the worker thread itself runs the item inline: a blocking
 * wait on a queued item from inside the queue would never complete.
 */
class SerialExecutor {
public:
    explicit SerialExecutor(std::string name = "commands")
    : service_(std::move(name))
    {}

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    template <typename Fn>
    auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();

        if (service_.runningInThisThread()) {
            (*task)();
            return future;
        }

        net::asio::post(service_.executor(), [task]{ (*task)(); });
        return future;
    }

    bool runningInThisThread() const { return service_.runningInThisThread(); }

    /// Run everything already queued, then stop the worker.
    void shutdown() { service_.shutdown(); }

private:
    net::NetService service_;
};

} // namespace fsremote::core
