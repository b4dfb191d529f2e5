#include "fsremote/core/CommandExecutor.hpp"

#include "TestSupport.hpp"
#include "fakes/FakeDeviceTransport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace fsremote;
using namespace std::chrono_literals;
using core::CommandExecutor;
using core::ConnectionConfig;
using core::SessionState;
using testing::FakeDeviceTransport;
using Outcome = FakeDeviceTransport::Outcome;

namespace {

const std::string kDevice = "http://192.168.0.153:80/device";

ConnectionConfig radioConfig() {
    ConnectionConfig config;
    config.rawInput = "192.168.0.153";
    config.pin = 1234;
    config.timeoutSeconds = 1;
    return config;
}

std::shared_ptr<FakeDeviceTransport> workingTransport() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::Connects);
    return transport;
}

template <typename T>
bool isNotConnected(const CommandExecutor::Result<T>& result) {
    return !result && result.error().kind == ErrorKind::NotConnected;
}

// Every guarded command must fail with NotConnected.
int countNotConnected(CommandExecutor& remote) {
    int rejected = 0;
    rejected += isNotConnected(remote.getFriendlyName());
    rejected += isNotConnected(remote.getPower());
    rejected += isNotConnected(remote.setPower(true));
    rejected += isNotConnected(remote.getVolume());
    rejected += isNotConnected(remote.setVolume(5));
    rejected += isNotConnected(remote.listModes());
    rejected += isNotConnected(remote.setMode(core::Mode{1, "DAB", "DAB", true}));
    rejected += isNotConnected(remote.listPresets());
    rejected += isNotConnected(remote.recallPreset(core::Preset{0, "Radio One"}));
    return rejected;
}

std::ptrdiff_t indexOf(const std::vector<std::string>& trace, const std::string& event) {
    auto it = std::find(trace.begin(), trace.end(), event);
    return it == trace.end() ? -1 : std::distance(trace.begin(), it);
}

} // namespace

static void testGuardWithoutConnection() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);

    ASSERT_TRUE(!remote.isConnected(), "starts disconnected");
    ASSERT_EQ(remote.state(), SessionState::Disconnected, "initial state");
    ASSERT_EQ(countNotConnected(remote), 9, "all nine commands rejected");
    ASSERT_EQ(transport->createCalls(), 0, "transport never created");
    ASSERT_EQ(transport->commandCalls(), 0, "transport never called");
}

static void testCommandsForwardToDevice() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);

    auto info = remote.connect(radioConfig());
    ASSERT_TRUE(info.has_value(), "connect through executor");
    ASSERT_TRUE(remote.isConnected(), "connected");
    ASSERT_TRUE(remote.activeUrl() == kDevice, "active url visible");

    auto name = remote.getFriendlyName();
    ASSERT_TRUE(name && *name == "Kitchen Radio", "friendly name");

    ASSERT_TRUE(remote.setPower(true).has_value(), "set power");
    auto power = remote.getPower();
    ASSERT_TRUE(power && *power, "power on");

    ASSERT_TRUE(remote.setVolume(25).has_value(), "set volume");
    auto volume = remote.getVolume();
    ASSERT_TRUE(volume && *volume == 25, "volume read back");

    auto modes = remote.listModes();
    ASSERT_TRUE(modes && modes->size() == 3, "three modes");
    if (modes && modes->size() == 3) {
        ASSERT_TRUE(remote.setMode((*modes)[1]).has_value(), "set mode");
        ASSERT_EQ(transport->shared()->selectedModeKey, 1, "mode key forwarded");
    }

    auto presets = remote.listPresets();
    ASSERT_TRUE(presets && presets->size() == 2, "two presets");
    if (presets && presets->size() == 2) {
        ASSERT_TRUE(remote.recallPreset((*presets)[1]).has_value(), "recall preset");
        ASSERT_EQ(transport->shared()->recalledToken, 1, "preset token forwarded");
    }
}

static void testSlowThenFastKeepsOrder() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);
    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "connect");

    transport->setDelay("setVolume", 200ms);

    auto slow = remote.setVolumeAsync(30);
    auto fast = remote.getVolumeAsync();

    auto fastResult = fast.get();
    auto slowResult = slow.get();
    ASSERT_TRUE(slowResult.has_value(), "slow op ok");
    ASSERT_TRUE(fastResult && *fastResult == 30, "fast op saw the slow op's effect");

    const auto trace = transport->trace();
    const auto slowEnd = indexOf(trace, "end:setVolume");
    const auto fastBegin = indexOf(trace, "begin:getVolume");
    ASSERT_TRUE(slowEnd >= 0 && fastBegin >= 0, "both ops traced");
    ASSERT_TRUE(slowEnd < fastBegin, "slow op completed before fast op dispatched");
}

static void testConcurrentCallersNeverOverlap() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);
    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "connect");

    transport->setDelay("getVolume", 1ms);
    transport->setDelay("setVolume", 1ms);

    constexpr int kThreads = 8;
    constexpr int kOpsPerThread = 15;
    std::atomic<int> failures{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t) {
        callers.emplace_back([&, t]{
            for (int i = 0; i < kOpsPerThread; ++i) {
                const bool ok = (i % 2 == 0) ? remote.setVolume(t).has_value()
                                             : remote.getVolume().has_value();
                if (!ok) failures.fetch_add(1);
            }
        });
    }
    for (auto& caller : callers) caller.join();

    ASSERT_EQ(failures.load(), 0, "every concurrent call succeeded");
    ASSERT_EQ(transport->maxInFlight(), 1, "never more than one device call in flight");
}

static void testDisconnectBlocksLaterCommands() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);
    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "connect");

    const int before = transport->commandCalls();
    remote.disconnect();

    ASSERT_TRUE(!remote.isConnected(), "disconnected");
    ASSERT_TRUE(!remote.activeUrl().has_value(), "no active url after disconnect");
    ASSERT_EQ(countNotConnected(remote), 9, "all commands rejected after disconnect");
    ASSERT_EQ(transport->commandCalls(), before, "transport untouched after disconnect");

    remote.disconnect(); // idempotent
    ASSERT_TRUE(!remote.isConnected(), "still disconnected");
}

static void testQueuedDisconnectWinsOverLaterCommand() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);
    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "connect");

    transport->setDelay("setPower", 150ms);
    const int before = transport->commandCalls();

    auto inFlight = remote.setPowerAsync(true);  // dispatched, slow
    auto closing = remote.disconnectAsync();     // queued behind it
    auto late = remote.getVolumeAsync();         // passes the submit guard, queued last

    ASSERT_TRUE(inFlight.get().has_value(), "in-flight call not aborted by disconnect");
    closing.get();
    auto lateResult = late.get();
    ASSERT_TRUE(isNotConnected(lateResult), "queued command re-checks the session");
    ASSERT_EQ(transport->commandCalls(), before + 1, "only the in-flight call reached the device");
}

static void testTransportFailureGoesToItsCaller() {
    auto transport = workingTransport();
    CommandExecutor remote(transport);
    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "connect");

    transport->failOperation("getVolume", std::make_error_code(std::errc::timed_out));

    auto failing = remote.getVolumeAsync();
    auto healthy = remote.getPowerAsync();

    auto failed = failing.get();
    ASSERT_TRUE(!failed.has_value(), "volume call failed");
    if (!failed) {
        ASSERT_EQ(failed.error().kind, ErrorKind::DeviceCallFailed, "device call failed kind");
        ASSERT_TRUE(failed.error().cause == std::errc::timed_out, "cause carried");
    }
    ASSERT_TRUE(healthy.get().has_value(), "other queued op unaffected");
    ASSERT_TRUE(remote.isConnected(), "session not demoted by a failed call");
}

static void testCommandsRejectedWhileConnecting() {
    auto transport = workingTransport();
    transport->setDelay("create", 200ms);
    CommandExecutor remote(transport);

    auto connecting = remote.connectAsync(radioConfig());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (remote.state() != SessionState::Connecting && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(remote.state(), SessionState::Connecting, "observed connecting state");

    auto early = remote.getVolume();
    ASSERT_TRUE(isNotConnected(early), "command rejected while connecting");
    ASSERT_EQ(transport->commandCalls(), 0, "nothing reached the device");

    ASSERT_TRUE(connecting.get().has_value(), "connect completes");
    ASSERT_TRUE(remote.getVolume().has_value(), "commands allowed once connected");
}

static void testAllCandidatesFailThroughExecutor() {
    auto transport = std::make_shared<FakeDeviceTransport>(); // nothing scripted: all refuse
    CommandExecutor remote(transport);

    auto info = remote.connect(radioConfig());
    ASSERT_TRUE(!info.has_value(), "connect fails");
    if (!info) {
        ASSERT_EQ(info.error().kind, ErrorKind::ConnectError, "connect error kind");
        ASSERT_EQ(info.error().attemptedUrls.size(), std::size_t{3}, "three urls attempted");
    }
    ASSERT_TRUE(!remote.isConnected(), "not connected");
    ASSERT_EQ(CommandExecutor::resolveCandidates("192.168.0.153").size(), std::size_t{3},
              "candidates exposed");
}

static void testReconnectReplacesSession() {
    auto transport = workingTransport();
    transport->script("http://10.0.0.7:80/fsapi", Outcome::Connects);
    CommandExecutor remote(transport);

    ASSERT_TRUE(remote.connect(radioConfig()).has_value(), "first connect");

    ConnectionConfig second;
    second.rawInput = "10.0.0.7";
    auto info = remote.connect(second);
    ASSERT_TRUE(info && info->activeUrl == "http://10.0.0.7:80/fsapi", "second radio selected");
    ASSERT_TRUE(remote.activeUrl() == std::string("http://10.0.0.7:80/fsapi"), "session replaced");
}

int main() {
    setLogLevel(LogLevel::Error);

    testGuardWithoutConnection();
    testCommandsForwardToDevice();
    testSlowThenFastKeepsOrder();
    testConcurrentCallersNeverOverlap();
    testDisconnectBlocksLaterCommands();
    testQueuedDisconnectWinsOverLaterCommand();
    testTransportFailureGoesToItsCaller();
    testCommandsRejectedWhileConnecting();
    testAllCandidatesFailThroughExecutor();
    testReconnectReplacesSession();
    return finishTests("CommandExecutor");
}
