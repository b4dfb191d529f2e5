#pragma once
#include "fsremote/net/NetConfig.hpp"

#include <memory>
#include <string>
#include <thread>

namespace fsremote::net {

/**
 * @brief RAII owner of one `asio::io_context` and the thread that runs it.
 *
 * fsremote runs two of these:
 * - the shared network service (`sharedNetService()`), which completes socket
 *   and timer handlers for every `TcpClient`;
 * - the command worker inside `core::SerialExecutor`, which runs device
 *   operations one at a time.
 * Keeping them apart lets a command block on a socket deadline without
 * starving the loop that completes the socket operation.
 *
 * Lifetime notes:
 * - `shutdown()` releases the work guard and joins the thread once every
 *   handler already posted has run. The destructor calls it.
 * - Handlers posted after `shutdown()` are never run.
 */
class NetService {
public:
    explicit NetService(std::string name);
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }
    asio::io_context::executor_type executor() { return io_->get_executor(); }

    /// True when called from a handler running on this service's thread.
    bool runningInThisThread() const;

    const std::string& name() const { return name_; }

    void shutdown();

private:
    std::string name_;
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread::id thread_id_{};
    std::thread t_;
};

NetService& sharedNetService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace fsremote::net
