#pragma once

#include "fsremote/core/DeviceTypes.hpp"
#include "fsremote/core/Error.hpp"
#include "fsremote/core/Expected.hpp"
#include "fsremote/transport/DeviceTransport.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace fsremote::core {

/**
 * @brief Owns the single live device session and the connect-with-fallback loop.
 *
 * Invariants:
 * - `isConnected()` is true iff a handle is held and it passed the probe.
 * - The session record (handle + active URL) is replaced as a whole; a new
 *   attempt starts by discarding the previous one, so a failed reconnect never
 *   leaves a stale session behind.
 *
 * Threading: `connect`, `disconnect`, `handle` and `activeUrl` must be called
 * from one thread at a time (CommandExecutor's worker). `isConnected` and
 * `state` are safe from any thread.
 */
class ConnectionSession {
public:
    explicit ConnectionSession(std::shared_ptr<transport::DeviceTransport> transport);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    expected<ConnectedInfo, Error> connect(const ConnectionConfig& config);

    void disconnect(); // idempotent

    bool isConnected() const;
    SessionState state() const;

    /// Borrowed handle; null unless connected. Do not keep it across calls.
    transport::DeviceHandle* handle() const;

    std::optional<std::string> activeUrl() const;

private:
    struct Record {
        std::unique_ptr<transport::DeviceHandle> handle;
        std::string activeUrl;
    };

    std::shared_ptr<transport::DeviceTransport> transport_;
    std::unique_ptr<Record> current_;
    std::atomic<SessionState> state_{SessionState::Disconnected};
};

} // namespace fsremote::core
