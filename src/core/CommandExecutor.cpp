#include "fsremote/core/CommandExecutor.hpp"

#include "fsremote/core/EndpointResolver.hpp"
#include "fsremote/log/Log.hpp"

#include <exception>
#include <type_traits>
#include <utility>

namespace fsremote::core {

using transport::DeviceHandle;

CommandExecutor::CommandExecutor(std::shared_ptr<transport::DeviceTransport> transport)
: session_(std::move(transport))
{}

CommandExecutor::~CommandExecutor() {
    // Queued operations still run; the session is dropped afterwards.
    worker_.shutdown();
}

template <typename T, typename Call>
CommandExecutor::Pending<T> CommandExecutor::dispatch(const char* operation, Call call) {
    // Guard at submission: never queue work for an absent session.
    if (!session_.isConnected()) {
        logWarning("[CommandExecutor] ", operation, " rejected: not connected\n");
        std::promise<Result<T>> rejected;
        rejected.set_value(unexpected(Error::notConnected(operation)));
        return rejected.get_future();
    }

    return worker_.submit([this, operation, call = std::move(call)]() -> Result<T> {
        // Re-check at execution: a disconnect or failed reconnect may be ahead of us.
        DeviceHandle* handle = session_.handle();
        if (!handle) {
            logWarning("[CommandExecutor] ", operation, " dropped: session closed while queued\n");
            return unexpected(Error::notConnected(operation));
        }

        try {
            auto result = call(*handle);
            if (!result) {
                logError("[CommandExecutor] ", operation, " failed: ", result.error().message(), "\n");
                return unexpected(Error::deviceCallFailed(operation, result.error()));
            }
            if constexpr (std::is_void_v<T>) {
                return {};
            } else {
                return Result<T>(std::move(*result));
            }
        } catch (const std::exception& ex) {
            logError("[CommandExecutor] ", operation, " threw: ", ex.what(), "\n");
            return unexpected(Error::deviceCallFailed(operation,
                                                      std::make_error_code(std::errc::io_error)));
        }
    });
}

std::vector<std::string> CommandExecutor::resolveCandidates(std::string_view input) {
    return EndpointResolver::resolve(input);
}

// Session lifecycle -----------------------------------------------------------

CommandExecutor::Result<ConnectedInfo> CommandExecutor::connect(const ConnectionConfig& config) {
    return connectAsync(config).get();
}

CommandExecutor::Pending<ConnectedInfo> CommandExecutor::connectAsync(ConnectionConfig config) {
    return worker_.submit([this, config = std::move(config)]() {
        return session_.connect(config);
    });
}

void CommandExecutor::disconnect() {
    disconnectAsync().get();
}

std::future<void> CommandExecutor::disconnectAsync() {
    return worker_.submit([this]{ session_.disconnect(); });
}

bool CommandExecutor::isConnected() const {
    return session_.isConnected();
}

SessionState CommandExecutor::state() const {
    return session_.state();
}

std::optional<std::string> CommandExecutor::activeUrl() {
    return worker_.submit([this]{ return session_.activeUrl(); }).get();
}

// Guarded commands ------------------------------------------------------------

CommandExecutor::Pending<std::string> CommandExecutor::getFriendlyNameAsync() {
    return dispatch<std::string>("getFriendlyName",
        [](DeviceHandle& device){ return device.friendlyName(); });
}

CommandExecutor::Pending<bool> CommandExecutor::getPowerAsync() {
    return dispatch<bool>("getPower",
        [](DeviceHandle& device){ return device.power(); });
}

CommandExecutor::Pending<void> CommandExecutor::setPowerAsync(bool on) {
    return dispatch<void>("setPower",
        [on](DeviceHandle& device){ return device.setPower(on); });
}

CommandExecutor::Pending<int> CommandExecutor::getVolumeAsync() {
    return dispatch<int>("getVolume",
        [](DeviceHandle& device){ return device.volume(); });
}

CommandExecutor::Pending<void> CommandExecutor::setVolumeAsync(int value) {
    return dispatch<void>("setVolume",
        [value](DeviceHandle& device){ return device.setVolume(value); });
}

CommandExecutor::Pending<std::vector<Mode>> CommandExecutor::listModesAsync() {
    return dispatch<std::vector<Mode>>("listModes",
        [](DeviceHandle& device){ return device.modes(); });
}

CommandExecutor::Pending<void> CommandExecutor::setModeAsync(Mode mode) {
    return dispatch<void>("setMode",
        [mode = std::move(mode)](DeviceHandle& device){ return device.setMode(mode); });
}

CommandExecutor::Pending<std::vector<Preset>> CommandExecutor::listPresetsAsync() {
    return dispatch<std::vector<Preset>>("listPresets",
        [](DeviceHandle& device){ return device.presets(); });
}

CommandExecutor::Pending<void> CommandExecutor::recallPresetAsync(Preset preset) {
    return dispatch<void>("recallPreset",
        [preset = std::move(preset)](DeviceHandle& device){ return device.recallPreset(preset); });
}

CommandExecutor::Result<std::string> CommandExecutor::getFriendlyName() { return getFriendlyNameAsync().get(); }
CommandExecutor::Result<bool> CommandExecutor::getPower() { return getPowerAsync().get(); }
CommandExecutor::Result<void> CommandExecutor::setPower(bool on) { return setPowerAsync(on).get(); }
CommandExecutor::Result<int> CommandExecutor::getVolume() { return getVolumeAsync().get(); }
CommandExecutor::Result<void> CommandExecutor::setVolume(int value) { return setVolumeAsync(value).get(); }
CommandExecutor::Result<std::vector<Mode>> CommandExecutor::listModes() { return listModesAsync().get(); }
CommandExecutor::Result<void> CommandExecutor::setMode(const Mode& mode) { return setModeAsync(mode).get(); }
CommandExecutor::Result<std::vector<Preset>> CommandExecutor::listPresets() { return listPresetsAsync().get(); }
CommandExecutor::Result<void> CommandExecutor::recallPreset(const Preset& preset) { return recallPresetAsync(preset).get(); }

} // namespace fsremote::core
