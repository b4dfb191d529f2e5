#pragma once
#include "fsremote/net/NetConfig.hpp"
#include "fsremote/net/Deadline.hpp"
#include "fsremote/net/TimeoutConfig.hpp"
#include "fsremote/net/NetService.hpp"
#include "fsremote/log/Log.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace fsremote::net {
using duration = TimeoutConfig::duration;

/**
 * @brief Blocking TCP socket wrapper with per-operation deadlines.
 *
 * - `connect(...)` walks resolver results, resetting the socket per attempt.
 *   The timeout covers the whole walk, not each endpoint.
 * - `write_all(...)` and `read_some(...)` block the caller until the
 *   operation completes or the deadline fires.
 * - Socket handlers run on a strand of the shared network service, so the
 *   caller must not be that service's thread.
 */
class TcpClient {
public:
    explicit TcpClient(duration timeout = TimeoutConfig::defaultTimeout())
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    , timeout_(sanitize(timeout))
    {}

    ~TcpClient() {
        close();
    }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setTimeout(duration timeout) { timeout_ = sanitize(timeout); }
    duration timeout() const { return timeout_; }

    /// Try each endpoint in turn; all attempts together share one timeout.
    error_code connect(const tcp::resolver::results_type& results) {
        error_code last = asio::error::host_not_found;
        const auto deadline = std::chrono::steady_clock::now() + timeout_;

        for (const auto& entry : results) {
            const auto left = std::chrono::duration_cast<duration>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return asio::error::timed_out;
            }
            close();
            socket_ = tcp::socket(strand_);
            const tcp::endpoint endpoint = entry.endpoint();
            auto ec = with_deadline(socket_.get_executor(), left,
                [&](auto completion){ socket_.async_connect(endpoint, completion); },
                [this]{ cancel(); }
            );
            if (!ec) {
                return ec;
            }
            logDebug("[TcpClient] connect to ", endpoint, " failed: ", ec.message(), "\n");
            last = ec;
        }
        return last;
    }

    error_code write_all(const void* buf, std::size_t n) {
        return with_deadline(socket_.get_executor(), timeout_,
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
    }

    /**
     * @brief Read whatever is available and append it to @p out.
     * @return `asio::error::eof` once the peer closed the connection.
     */
    error_code read_some(std::string& out) {
        auto chunk = std::make_shared<std::array<char, 4096>>();
        auto transferred = std::make_shared<std::size_t>(0);

        auto ec = with_deadline(socket_.get_executor(), timeout_,
            [&](auto completion){
                socket_.async_read_some(asio::buffer(*chunk),
                    [chunk, transferred, completion](const error_code& op_ec, std::size_t n){
                        *transferred = n;
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );

        // On timeout the read handler may still be pending; leave its count alone.
        if (ec != asio::error::timed_out) {
            out.append(chunk->data(), *transferred);
        }
        return ec;
    }

    bool is_open() const { return socket_.is_open(); }

    void cancel() {
        error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    duration timeout_;
};

} // namespace fsremote::net
