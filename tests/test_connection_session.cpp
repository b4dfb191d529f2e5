#include "fsremote/core/ConnectionSession.hpp"
#include "fsremote/net/TimeoutConfig.hpp"

#include "TestSupport.hpp"
#include "fakes/FakeDeviceTransport.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace fsremote;
using core::ConnectionConfig;
using core::ConnectionSession;
using core::SessionState;
using testing::FakeDeviceTransport;
using Outcome = FakeDeviceTransport::Outcome;

namespace {

const std::string kDevice = "http://192.168.0.153:80/device";
const std::string kFsapi = "http://192.168.0.153:80/fsapi";
const std::string kBare = "http://192.168.0.153";

ConnectionConfig radioConfig() {
    ConnectionConfig config;
    config.rawInput = "192.168.0.153";
    config.pin = 1234;
    config.timeoutSeconds = 1;
    return config;
}

} // namespace

static void testFirstWorkingCandidateWins() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::CreateFails);
    transport->script(kFsapi, Outcome::Connects);
    transport->script(kBare, Outcome::Connects);

    ConnectionSession session(transport);
    auto info = session.connect(radioConfig());

    ASSERT_TRUE(info.has_value(), "connect succeeds on second candidate");
    if (info) {
        ASSERT_EQ(info->activeUrl, kFsapi, "active url is the first working candidate");
        ASSERT_EQ(info->friendlyName, std::string("Kitchen Radio"), "probe result returned");
        ASSERT_EQ(info->attemptedUrls.size(), std::size_t{2}, "attempted up to the winner");
    }
    ASSERT_TRUE(session.isConnected(), "session connected");
    ASSERT_EQ(session.state(), SessionState::Connected, "state connected");
    ASSERT_TRUE(session.activeUrl() == kFsapi, "session remembers active url");
    ASSERT_EQ(transport->createCalls(), 2, "bare host never attempted");
    ASSERT_TRUE(transport->createdUrls() == (std::vector<std::string>{kDevice, kFsapi}),
                "candidates tried in priority order");
}

static void testProbeFailureFallsThrough() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::ProbeFails);
    transport->script(kFsapi, Outcome::Throws);
    transport->script(kBare, Outcome::Connects);

    ConnectionSession session(transport);
    auto info = session.connect(radioConfig());

    ASSERT_TRUE(info.has_value(), "connect succeeds on last candidate");
    ASSERT_TRUE(session.activeUrl() == kBare, "bare host used last");
    ASSERT_EQ(transport->probeCalls(), 2, "probe attempted for each created handle");
    ASSERT_EQ(transport->createCalls(), 3, "all three candidates created");
}

static void testAllCandidatesFail() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::ProbeFails);
    transport->script(kFsapi, Outcome::CreateFails);
    transport->script(kBare, Outcome::CreateFails);

    ConnectionSession session(transport);
    auto info = session.connect(radioConfig());

    ASSERT_TRUE(!info.has_value(), "connect fails");
    if (!info) {
        ASSERT_EQ(info.error().kind, ErrorKind::ConnectError, "connect error kind");
        ASSERT_TRUE(info.error().attemptedUrls == (std::vector<std::string>{kDevice, kFsapi, kBare}),
                    "every attempted url reported");
        ASSERT_TRUE(info.error().cause == std::errc::connection_refused, "last cause kept");
        ASSERT_TRUE(info.error().describe().find(kBare) != std::string::npos, "message lists urls");
    }
    ASSERT_TRUE(!session.isConnected(), "still disconnected");
    ASSERT_EQ(session.state(), SessionState::Disconnected, "state disconnected");
    ASSERT_TRUE(session.handle() == nullptr, "no handle");
    ASSERT_TRUE(!session.activeUrl().has_value(), "no active url");
}

static void testFailedReconnectClearsPreviousSession() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::Connects);

    ConnectionSession session(transport);
    ASSERT_TRUE(session.connect(radioConfig()).has_value(), "first connect");
    ASSERT_TRUE(session.isConnected(), "connected after first connect");

    ConnectionConfig other;
    other.rawInput = "10.9.9.9";
    auto second = session.connect(other);
    ASSERT_TRUE(!second.has_value(), "second connect fails");
    ASSERT_TRUE(!session.isConnected(), "stale session dropped");
    ASSERT_TRUE(session.handle() == nullptr, "no stale handle");
}

static void testEmptyInputIsInvalid() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    ConnectionSession session(transport);

    ConnectionConfig config;
    config.rawInput = "   ";
    auto info = session.connect(config);
    ASSERT_TRUE(!info.has_value(), "blank address rejected");
    if (!info) {
        ASSERT_EQ(info.error().kind, ErrorKind::InvalidInput, "invalid input kind");
    }
    ASSERT_EQ(transport->createCalls(), 0, "transport untouched");
}

static void testDisconnectIsIdempotent() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::Connects);

    ConnectionSession session(transport);
    session.disconnect();
    ASSERT_TRUE(!session.isConnected(), "disconnect on empty session");

    ASSERT_TRUE(session.connect(radioConfig()).has_value(), "connect");
    session.disconnect();
    session.disconnect();
    ASSERT_TRUE(!session.isConnected(), "disconnected");
    ASSERT_TRUE(session.handle() == nullptr, "handle released");
}

static void testNonStandardThrowIsContained() {
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::ThrowsNonStandard);
    transport->script(kFsapi, Outcome::ThrowsNonStandard);
    transport->script(kBare, Outcome::ThrowsNonStandard);

    ConnectionSession session(transport);
    bool escaped = false;
    expected<core::ConnectedInfo, Error> info = unexpected(Error::invalidInput("not run"));
    try {
        info = session.connect(radioConfig());
    } catch (int) {
        escaped = true;
    }

    ASSERT_TRUE(!escaped, "candidate failure stays inside connect()");
    ASSERT_TRUE(!info.has_value(), "connect fails");
    if (!info) {
        ASSERT_EQ(info.error().kind, ErrorKind::ConnectError, "connect error kind");
        ASSERT_EQ(info.error().attemptedUrls.size(), std::size_t{3}, "every candidate tried");
    }
    ASSERT_EQ(session.state(), SessionState::Disconnected, "state after exhausted attempts");

    // A later candidate still wins after a non-standard throw.
    transport->script(kBare, Outcome::Connects);
    auto retry = session.connect(radioConfig());
    ASSERT_TRUE(retry && retry->activeUrl == kBare, "falls through to the working candidate");
    ASSERT_EQ(session.state(), SessionState::Connected, "connected after fallthrough");
}

static void testTimeoutFromSettings() {
    using fsremote::net::TimeoutConfig;
    auto transport = std::make_shared<FakeDeviceTransport>();
    transport->script(kDevice, Outcome::Connects);
    ConnectionSession session(transport);

    auto config = radioConfig();
    config.timeoutSeconds = 3;
    ASSERT_TRUE(session.connect(config).has_value(), "connect with explicit timeout");
    ASSERT_EQ(transport->lastTimeout().count(), 3000, "seconds converted to milliseconds");

    const auto previous = TimeoutConfig::defaultTimeout();
    TimeoutConfig::setDefault(std::chrono::milliseconds{750});
    config.timeoutSeconds = 0;
    ASSERT_TRUE(session.connect(config).has_value(), "connect with default timeout");
    ASSERT_EQ(transport->lastTimeout().count(), 750, "non-positive timeout uses the default");
    TimeoutConfig::setDefault(previous);
}

int main() {
    setLogLevel(LogLevel::Error);

    testFirstWorkingCandidateWins();
    testProbeFailureFallsThrough();
    testAllCandidatesFail();
    testFailedReconnectClearsPreviousSession();
    testEmptyInputIsInvalid();
    testDisconnectIsIdempotent();
    testNonStandardThrowIsContained();
    testTimeoutFromSettings();
    return finishTests("ConnectionSession");
}
