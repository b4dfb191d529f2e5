#pragma once

#include "fsremote/core/DeviceTypes.hpp"
#include "fsremote/core/Expected.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fsremote::transport {

using core::Mode;
using core::Preset;

/**
 * @brief One authenticated connection to a radio, produced by DeviceTransport.
 *
 * Implementations perform blocking calls, each bounded by the timeout given
 * at creation. Handles are not thread-safe; the command service only touches
 * them from its serialized worker.
 */
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    /// Human-readable device name; doubles as the post-connect probe.
    virtual expected<std::string> friendlyName() = 0;

    virtual expected<bool> power() = 0;
    virtual expected<void> setPower(bool on) = 0;

    virtual expected<int> volume() = 0;
    virtual expected<void> setVolume(int value) = 0;

    virtual expected<std::vector<Mode>> modes() = 0;
    virtual expected<void> setMode(const Mode& mode) = 0;

    virtual expected<std::vector<Preset>> presets() = 0;
    virtual expected<void> recallPreset(const Preset& preset) = 0;
};

/**
 * @brief Factory for device handles. The wire protocol lives behind this seam.
 */
class DeviceTransport {
public:
    using duration = std::chrono::milliseconds;

    virtual ~DeviceTransport() = default;

    virtual expected<std::unique_ptr<DeviceHandle>>
    create(const std::string& baseUrl, int pin, duration timeout) = 0;
};

} // namespace fsremote::transport
