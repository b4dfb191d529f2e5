#pragma once

#include <string>
#include <vector>

namespace fsremote::core {

/**
 * @brief Inputs for one connection attempt. Copied by value into the attempt.
 */
struct ConnectionConfig {
    /// Free-form address: "192.168.0.153", "radio.local:8080", "http://x/fsapi".
    std::string rawInput;
    int pin = 1234;
    /// Per-request bound; values <= 0 fall back to net::TimeoutConfig.
    int timeoutSeconds = 2;
};

struct ConnectedInfo {
    std::string friendlyName;
    std::string activeUrl;
    std::vector<std::string> attemptedUrls;
};

enum class SessionState {
    Disconnected,
    Connecting,
    Connected
};

const char* toString(SessionState state);

/// One entry of the radio's operating-mode list (Internet radio, DAB, ...).
struct Mode {
    int key = 0;            // list key used to select the mode
    std::string id;         // short id, e.g. "IR"
    std::string label;      // display label, e.g. "Internet radio"
    bool selectable = true;
};

struct Preset {
    int token = 0;          // opaque recall token
    std::string label;
};

inline bool operator==(const Mode& a, const Mode& b) {
    return a.key == b.key && a.id == b.id && a.label == b.label && a.selectable == b.selectable;
}

inline bool operator==(const Preset& a, const Preset& b) {
    return a.token == b.token && a.label == b.label;
}

} // namespace fsremote::core
