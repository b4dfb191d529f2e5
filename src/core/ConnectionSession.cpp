#include "fsremote/core/ConnectionSession.hpp"

#include "fsremote/core/EndpointResolver.hpp"
#include "fsremote/log/Log.hpp"
#include "fsremote/net/TimeoutConfig.hpp"

#include <atomic>
#include <exception>
#include <utility>

namespace fsremote::core {

namespace {

// Leaves Connecting on every exit from the candidate loop, unwinding included.
struct ConnectingGuard {
    std::atomic<SessionState>& state;

    ~ConnectingGuard() {
        auto expected = SessionState::Connecting;
        state.compare_exchange_strong(expected, SessionState::Disconnected);
    }
};

} // namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Connected:    return "connected";
    }
    return "unknown";
}

ConnectionSession::ConnectionSession(std::shared_ptr<transport::DeviceTransport> transport)
: transport_(std::move(transport))
{}

ConnectionSession::~ConnectionSession() {
    disconnect();
}

expected<ConnectedInfo, Error> ConnectionSession::connect(const ConnectionConfig& config) {
    // Drop whatever we had before trying anything new.
    disconnect();

    auto candidates = EndpointResolver::resolve(config.rawInput);
    if (candidates.empty()) {
        logError("[ConnectionSession] no radio address given\n");
        return unexpected(Error::invalidInput("radio address is empty"));
    }

    if (!transport_) {
        return unexpected(Error::connectError(std::move(candidates),
                                              std::make_error_code(std::errc::not_supported)));
    }

    const auto timeout = net::TimeoutConfig::fromSeconds(config.timeoutSeconds);
    state_.store(SessionState::Connecting);
    ConnectingGuard connecting{state_};

    std::error_code lastError = std::make_error_code(std::errc::host_unreachable);
    std::vector<std::string> attempted;
    attempted.reserve(candidates.size());

    for (const auto& url : candidates) {
        attempted.push_back(url);
        logInfo("[ConnectionSession] trying ", url, "\n");

        try {
            auto created = transport_->create(url, config.pin, timeout);
            if (!created) {
                lastError = created.error();
                logWarning("[ConnectionSession] ", url, " create failed: ", lastError.message(), "\n");
                continue;
            }
            if (!*created) {
                lastError = std::make_error_code(std::errc::not_connected);
                logWarning("[ConnectionSession] ", url, " returned no handle\n");
                continue;
            }

            auto name = (*created)->friendlyName();
            if (!name) {
                lastError = name.error();
                logWarning("[ConnectionSession] ", url, " probe failed: ", lastError.message(), "\n");
                continue;
            }

            auto record = std::make_unique<Record>();
            record->handle = std::move(*created);
            record->activeUrl = url;
            current_ = std::move(record);
            state_.store(SessionState::Connected);

            logInfo("[ConnectionSession] connected to '", *name, "' at ", url, "\n");
            return ConnectedInfo{std::move(*name), url, std::move(attempted)};
        } catch (const std::exception& ex) {
            lastError = std::make_error_code(std::errc::io_error);
            logWarning("[ConnectionSession] ", url, " threw: ", ex.what(), "\n");
        } catch (...) {
            lastError = std::make_error_code(std::errc::io_error);
            logWarning("[ConnectionSession] ", url, " threw a non-standard exception\n");
        }
    }

    state_.store(SessionState::Disconnected);
    auto error = Error::connectError(std::move(attempted), lastError);
    logError("[ConnectionSession] ", error.describe(), "\n");
    return unexpected(std::move(error));
}

void ConnectionSession::disconnect() {
    state_.store(SessionState::Disconnected);
    if (current_) {
        logInfo("[ConnectionSession] disconnected from ", current_->activeUrl, "\n");
        current_.reset();
    }
}

bool ConnectionSession::isConnected() const {
    return state_.load() == SessionState::Connected;
}

SessionState ConnectionSession::state() const {
    return state_.load();
}

transport::DeviceHandle* ConnectionSession::handle() const {
    if (!isConnected() || !current_) {
        return nullptr;
    }
    return current_->handle.get();
}

std::optional<std::string> ConnectionSession::activeUrl() const {
    if (!isConnected() || !current_) {
        return std::nullopt;
    }
    return current_->activeUrl;
}

} // namespace fsremote::core
