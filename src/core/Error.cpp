#include "fsremote/core/Error.hpp"

#include <sstream>
#include <utility>

namespace fsremote {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:     return "invalid input";
        case ErrorKind::ConnectError:     return "connection failed";
        case ErrorKind::NotConnected:     return "not connected";
        case ErrorKind::DeviceCallFailed: return "device call failed";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << toString(kind) << ": " << message;
    if (cause) {
        oss << " (" << cause.message() << ")";
    }
    return oss.str();
}

Error Error::invalidInput(std::string_view detail) {
    Error error;
    error.kind = ErrorKind::InvalidInput;
    error.message = std::string(detail);
    return error;
}

Error Error::connectError(std::vector<std::string> attempted, std::error_code lastCause) {
    std::ostringstream oss;
    oss << "could not connect to the radio. Tried: ";
    for (std::size_t i = 0; i < attempted.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << attempted[i];
    }

    Error error;
    error.kind = ErrorKind::ConnectError;
    error.message = oss.str();
    error.cause = lastCause;
    error.attemptedUrls = std::move(attempted);
    return error;
}

Error Error::notConnected(std::string_view operation) {
    Error error;
    error.kind = ErrorKind::NotConnected;
    error.message = std::string(operation) + " requires a connected radio";
    return error;
}

Error Error::deviceCallFailed(std::string_view operation, std::error_code cause) {
    Error error;
    error.kind = ErrorKind::DeviceCallFailed;
    error.message = std::string(operation) + " failed";
    error.cause = cause;
    return error;
}

} // namespace fsremote
