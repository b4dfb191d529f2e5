#pragma once

#include "fsremote/core/Expected.hpp"
#include "fsremote/fsapi/FsapiResponse.hpp"
#include "fsremote/net/HttpClient.hpp"
#include "fsremote/transport/DeviceTransport.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fsremote::fsapi {

using transport::DeviceHandle;
using transport::DeviceTransport;

/**
 * @brief A live FSAPI session with one radio.
 *
 * Every request carries the PIN and the session id obtained from
 * CREATE_SESSION. Requests are plain blocking HTTP GETs bounded by the
 * transport timeout.
 */
class FsapiDevice : public DeviceHandle {
public:
    FsapiDevice(std::string endpoint, int pin, std::string sessionId, net::HttpClient http);

    expected<std::string> friendlyName() override;

    expected<bool> power() override;
    expected<void> setPower(bool on) override;

    expected<int> volume() override;
    expected<void> setVolume(int value) override;

    expected<std::vector<core::Mode>> modes() override;
    expected<void> setMode(const core::Mode& mode) override;

    expected<std::vector<core::Preset>> presets() override;
    expected<void> recallPreset(const core::Preset& preset) override;

    const std::string& endpoint() const { return endpoint_; }
    const std::string& sessionId() const { return sessionId_; }

private:
    expected<FsapiResponse> request(std::string_view operation,
                                    std::string_view node,
                                    std::string_view extraQuery = {});

    expected<long long> getInteger(std::string_view node);
    expected<void> setValue(std::string_view node, long long value);
    /// Every item of a list node, fetched page by page until <listend/>.
    expected<std::vector<FsapiListItem>> listItems(std::string_view node, std::size_t pageSize);
    expected<void> enableNavigation();

    std::string endpoint_;
    int pin_;
    std::string sessionId_;
    net::HttpClient http_;
};

/**
 * @brief DeviceTransport that speaks FSAPI over HTTP.
 *
 * `create()` accepts the candidate URLs produced by EndpointResolver:
 * - ".../fsapi" is used as the API endpoint directly;
 * - anything else is fetched as a device descriptor and its `<webfsapi>`
 *   element names the endpoint.
 * A session is then opened with CREATE_SESSION.
 */
class FsapiTransport : public DeviceTransport {
public:
    expected<std::unique_ptr<DeviceHandle>>
    create(const std::string& baseUrl, int pin, duration timeout) override;

    /// Resolve @p baseUrl to the FSAPI endpoint (may perform one GET).
    static expected<std::string> discoverEndpoint(const std::string& baseUrl,
                                                  const net::HttpClient& http);

    static expected<std::string> discoverEndpoint(const std::string& baseUrl,
                                                  const net::HttpClient& http,
                                                  net::HttpClient::clock::time_point deadline);
};

} // namespace fsremote::fsapi
