#pragma once

#include <atomic>
#include <chrono>

namespace fsremote::net {

/**
 * @brief Process-wide default for HTTP request deadlines.
 *
 * Used whenever a connection attempt does not carry its own positive timeout.
 * Safe to read from the command worker while another thread changes it.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static constexpr duration kInitialDefault{2000}; // radios answer slowly on wake

    /** Negative values clamp to zero. */
    static void setDefault(duration timeout) {
        millis().store(timeout.count() < 0 ? 0 : timeout.count());
    }

    static duration defaultTimeout() {
        return duration{millis().load()};
    }

    /// Seconds from user settings; non-positive values mean "use the default".
    static duration fromSeconds(int seconds) {
        if (seconds <= 0) {
            return defaultTimeout();
        }
        return std::chrono::duration_cast<duration>(std::chrono::seconds{seconds});
    }

private:
    static std::atomic<duration::rep>& millis() {
        static std::atomic<duration::rep> value{kInitialDefault.count()};
        return value;
    }
};

} // namespace fsremote::net
