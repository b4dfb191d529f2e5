#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fsremote {

/**
 * @brief Failure classes surfaced by the connection and command service.
 *
 * - InvalidInput: the address was empty or could not be turned into a URL.
 * - ConnectError: every candidate URL failed creation or probing.
 * - NotConnected: a guarded command ran without an active session.
 * - DeviceCallFailed: the transport failed while a session was believed live.
 *   The session is not demoted; callers decide whether to reconnect.
 */
enum class ErrorKind {
    InvalidInput,
    ConnectError,
    NotConnected,
    DeviceCallFailed
};

const char* toString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::DeviceCallFailed;
    std::string message;

    /// Underlying transport cause (empty for InvalidInput / NotConnected).
    std::error_code cause{};

    /// Every URL tried, in trial order (ConnectError only).
    std::vector<std::string> attemptedUrls{};

    /// "<kind>: <message>[ (cause)]" for presentation layers.
    std::string describe() const;

    static Error invalidInput(std::string_view detail);
    static Error connectError(std::vector<std::string> attempted, std::error_code lastCause);
    static Error notConnected(std::string_view operation);
    static Error deviceCallFailed(std::string_view operation, std::error_code cause);
};

} // namespace fsremote
