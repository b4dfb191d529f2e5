#pragma once

#include "fsremote/core/ConnectionSession.hpp"
#include "fsremote/core/DeviceTypes.hpp"
#include "fsremote/core/Error.hpp"
#include "fsremote/core/Expected.hpp"
#include "fsremote/core/SerialExecutor.hpp"
#include "fsremote/transport/DeviceTransport.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsremote::core {

/**
 * @brief Public remote-control surface: connect, disconnect and nine guarded
 *        device commands, all serialized on one worker.
 *
 * Guarantees:
 * - At most one device call is in flight at any time.
 * - Operations run in submission order; connect and disconnect are queued
 *   like any command, so a connect never races an in-flight command.
 * - A command issued while not connected fails with `NotConnected` right away
 *   and is never queued. Queued commands re-check the session when they reach
 *   the front of the queue, so a disconnect queued ahead of them wins.
 * - Transport errors become `DeviceCallFailed` for the submitting caller only.
 *   The session stays connected; callers decide whether to reconnect.
 *
 * Blocking methods wait for their own result. The `...Async` variants return
 * a future instead, letting one caller queue several operations.
 */
class CommandExecutor {
public:
    template <typename T>
    using Result = expected<T, Error>;

    template <typename T>
    using Pending = std::future<Result<T>>;

    explicit CommandExecutor(std::shared_ptr<transport::DeviceTransport> transport);
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    static std::vector<std::string> resolveCandidates(std::string_view input);

    Result<ConnectedInfo> connect(const ConnectionConfig& config);
    Pending<ConnectedInfo> connectAsync(ConnectionConfig config);

    void disconnect();
    std::future<void> disconnectAsync();

    bool isConnected() const;
    SessionState state() const;
    std::optional<std::string> activeUrl();

    Result<std::string> getFriendlyName();
    Result<bool> getPower();
    Result<void> setPower(bool on);
    Result<int> getVolume();
    Result<void> setVolume(int value);
    Result<std::vector<Mode>> listModes();
    Result<void> setMode(const Mode& mode);
    Result<std::vector<Preset>> listPresets();
    Result<void> recallPreset(const Preset& preset);

    Pending<std::string> getFriendlyNameAsync();
    Pending<bool> getPowerAsync();
    Pending<void> setPowerAsync(bool on);
    Pending<int> getVolumeAsync();
    Pending<void> setVolumeAsync(int value);
    Pending<std::vector<Mode>> listModesAsync();
    Pending<void> setModeAsync(Mode mode);
    Pending<std::vector<Preset>> listPresetsAsync();
    Pending<void> recallPresetAsync(Preset preset);

private:
    template <typename T, typename Call>
    Pending<T> dispatch(const char* operation, Call call);

    ConnectionSession session_;
    SerialExecutor worker_;
};

} // namespace fsremote::core
