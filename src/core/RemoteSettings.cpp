#include "fsremote/core/RemoteSettings.hpp"

#include "fsremote/log/Log.hpp"

#include <charconv>
#include <cstdlib>

namespace fsremote::core {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int readEnvInt(const char* name, int fallback) {
    auto text = readEnv(name);
    if (!text) {
        return fallback;
    }
    int parsed = 0;
    const auto* first = text->data();
    const auto* last = text->data() + text->size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) {
        logWarning("[RemoteSettings] ignoring ", name, "='", *text, "' (not a number)\n");
        return fallback;
    }
    return parsed;
}

} // namespace

ConnectionConfig RemoteSettings::connectionConfig() const {
    ConnectionConfig config;
    config.rawInput = url;
    config.pin = pin;
    config.timeoutSeconds = timeoutSeconds;
    return config;
}

RemoteSettings RemoteSettings::fromEnvironment() {
    RemoteSettings settings;
    if (auto url = readEnv("FSREMOTE_URL")) {
        settings.url = std::move(*url);
    }
    settings.pin = readEnvInt("FSREMOTE_PIN", settings.pin);
    settings.timeoutSeconds = readEnvInt("FSREMOTE_TIMEOUT", settings.timeoutSeconds);
    if (auto mode = readEnv("FSREMOTE_LAST_MODE")) {
        settings.lastMode = std::move(*mode);
    }
    return settings;
}

std::optional<Mode> pickRestoredMode(const std::vector<Mode>& modes, std::string_view lastMode) {
    for (const auto& mode : modes) {
        if (mode.id == lastMode || mode.label == lastMode) {
            return mode;
        }
    }
    if (modes.empty()) {
        return std::nullopt;
    }
    return modes.front();
}

} // namespace fsremote::core
