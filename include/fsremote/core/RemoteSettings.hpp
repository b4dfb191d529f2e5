#pragma once

#include "fsremote/core/DeviceTypes.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsremote::core {

namespace defaults {
constexpr std::string_view URL = "192.168.0.153"; // bare host; the resolver adds paths
constexpr int PIN = 1234;
constexpr int TIMEOUT_SECONDS = 2;
constexpr std::string_view LAST_MODE = "IRadio";
} // namespace defaults

/**
 * @brief User-facing connection settings, as a shell or config store holds them.
 *
 * `lastMode` is carried through untouched; the service never interprets it
 * beyond `pickRestoredMode`.
 */
struct RemoteSettings {
    std::string url{defaults::URL};
    int pin = defaults::PIN;
    int timeoutSeconds = defaults::TIMEOUT_SECONDS;
    std::string lastMode{defaults::LAST_MODE};

    ConnectionConfig connectionConfig() const;

    /**
     * Defaults overridden by FSREMOTE_URL, FSREMOTE_PIN, FSREMOTE_TIMEOUT and
     * FSREMOTE_LAST_MODE. Empty values, and numbers that do not parse, keep
     * the default.
     */
    static RemoteSettings fromEnvironment();
};

/// Mode whose id or label equals @p lastMode; else the first mode; else none.
std::optional<Mode> pickRestoredMode(const std::vector<Mode>& modes, std::string_view lastMode);

} // namespace fsremote::core
