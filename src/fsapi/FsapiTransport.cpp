/**
 * @brief FSAPI (Frontier Silicon) HTTP transport: endpoint discovery, session
 *        setup and the node reads/writes behind each remote-control command.
 */
#include "fsremote/fsapi/FsapiTransport.hpp"

#include "fsremote/fsapi/FsapiConfig.hpp"
#include "fsremote/fsapi/FsapiError.hpp"
#include "fsremote/log/Log.hpp"

#include <string>
#include <utility>

namespace fsremote::fsapi {

namespace {

std::error_code httpStatusError(int status) {
    switch (status) {
        case 403: return Errc::InvalidPin;
        case 404: return Errc::NoSession;
        default:  return Errc::HttpStatus;
    }
}

std::string_view trimTrailingSlash(std::string_view url) {
    while (!url.empty() && url.back() == '/') url.remove_suffix(1);
    return url;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// FsapiTransport --------------------------------------------------------------

expected<std::string>
FsapiTransport::discoverEndpoint(const std::string& baseUrl, const net::HttpClient& http) {
    return discoverEndpoint(baseUrl, http, net::HttpClient::clock::now() + http.timeout());
}

expected<std::string>
FsapiTransport::discoverEndpoint(const std::string& baseUrl,
                                 const net::HttpClient& http,
                                 net::HttpClient::clock::time_point deadline) {
    const auto base = trimTrailingSlash(baseUrl);
    if (endsWith(base, config::FSAPI_PATH_ROOT)) {
        return std::string(base);
    }

    auto descriptor = http.get(std::string(base), deadline);
    if (!descriptor) {
        return unexpected(descriptor.error());
    }
    if (!descriptor->ok()) {
        logDebug("[FsapiTransport] ", base, " answered HTTP ", descriptor->status, "\n");
        return unexpected(make_error_code(Errc::HttpStatus));
    }

    auto endpoint = findWebfsapiEndpoint(descriptor->body);
    if (!endpoint) {
        return unexpected(make_error_code(Errc::NoEndpoint));
    }
    return std::string(trimTrailingSlash(*endpoint));
}

expected<std::unique_ptr<DeviceHandle>>
FsapiTransport::create(const std::string& baseUrl, int pin, duration timeout) {
    net::HttpClient http(timeout);
    // Discovery and CREATE_SESSION together must fit in one timeout.
    const auto deadline = net::HttpClient::clock::now() + http.timeout();

    auto endpoint = discoverEndpoint(baseUrl, http, deadline);
    if (!endpoint) {
        return unexpected(endpoint.error());
    }

    const std::string url = *endpoint + "/" + std::string(config::OP_CREATE_SESSION)
                          + "?pin=" + std::to_string(pin);
    auto reply = http.get(url, deadline);
    if (!reply) {
        return unexpected(reply.error());
    }
    if (!reply->ok()) {
        return unexpected(httpStatusError(reply->status));
    }

    auto decoded = FsapiResponse::decode(reply->body);
    if (!decoded) {
        return unexpected(decoded.error());
    }
    if (auto ec = decoded->error(); ec) {
        return unexpected(ec);
    }
    if (!decoded->sessionId || decoded->sessionId->empty()) {
        return unexpected(make_error_code(Errc::MalformedResponse));
    }

    logInfo("[FsapiTransport] session ", *decoded->sessionId, " opened on ", *endpoint, "\n");

    return std::unique_ptr<DeviceHandle>(
        std::make_unique<FsapiDevice>(*endpoint, pin, *decoded->sessionId, std::move(http)));
}

// FsapiDevice -----------------------------------------------------------------

FsapiDevice::FsapiDevice(std::string endpoint, int pin, std::string sessionId, net::HttpClient http)
: endpoint_(std::move(endpoint))
, pin_(pin)
, sessionId_(std::move(sessionId))
, http_(std::move(http))
{}

expected<FsapiResponse>
FsapiDevice::request(std::string_view operation, std::string_view node, std::string_view extraQuery) {
    std::string url = endpoint_;
    url += '/';
    url += operation;
    url += '/';
    url += node;
    url += "?pin=";
    url += std::to_string(pin_);
    url += "&sid=";
    url += net::urlEncode(sessionId_);
    if (!extraQuery.empty()) {
        url += '&';
        url += extraQuery;
    }

    auto reply = http_.get(url);
    if (!reply) {
        return unexpected(reply.error());
    }
    if (!reply->ok()) {
        logDebug("[FsapiDevice] ", operation, ' ', node, " -> HTTP ", reply->status, "\n");
        return unexpected(httpStatusError(reply->status));
    }
    return FsapiResponse::decode(reply->body);
}

expected<long long> FsapiDevice::getInteger(std::string_view node) {
    auto response = request(config::OP_GET, node);
    if (!response) {
        return unexpected(response.error());
    }
    return response->integer();
}

expected<void> FsapiDevice::setValue(std::string_view node, long long value) {
    auto response = request(config::OP_SET, node, "value=" + std::to_string(value));
    if (!response) {
        return unexpected(response.error());
    }
    if (auto ec = response->error(); ec) {
        return unexpected(ec);
    }
    return {};
}

expected<std::vector<FsapiListItem>>
FsapiDevice::listItems(std::string_view node, std::size_t pageSize) {
    std::vector<FsapiListItem> all;
    long long after = -1; // LIST_GET_NEXT returns items with keys after this one

    for (;;) {
        const std::string pageNode = std::string(node) + "/" + std::to_string(after);
        auto response = request(config::OP_LIST_GET_NEXT, pageNode,
                                "maxItems=" + std::to_string(pageSize));
        if (!response) {
            return unexpected(response.error());
        }
        const auto ec = response->error();
        if (ec == Errc::ListEnd) {
            break;
        }
        if (ec) {
            return unexpected(ec);
        }

        const bool last = response->listEnd || response->items.empty();
        const long long nextAfter = response->items.empty() ? after : response->items.back().key;
        for (auto& item : response->items) {
            all.push_back(std::move(item));
        }
        if (last) {
            break;
        }
        if (nextAfter <= after) {
            logWarning("[FsapiDevice] ", node, " paging did not advance past key ", after, "\n");
            break;
        }
        after = nextAfter;
    }
    return all;
}

expected<void> FsapiDevice::enableNavigation() {
    return setValue(config::NODE_NAV_STATE, 1);
}

expected<std::string> FsapiDevice::friendlyName() {
    auto response = request(config::OP_GET, config::NODE_FRIENDLY_NAME);
    if (!response) {
        return unexpected(response.error());
    }
    return response->text();
}

expected<bool> FsapiDevice::power() {
    return getInteger(config::NODE_POWER).map([](long long v){ return v != 0; });
}

expected<void> FsapiDevice::setPower(bool on) {
    return setValue(config::NODE_POWER, on ? 1 : 0);
}

expected<int> FsapiDevice::volume() {
    return getInteger(config::NODE_VOLUME).map([](long long v){ return static_cast<int>(v); });
}

expected<void> FsapiDevice::setVolume(int value) {
    if (value < 0) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return setValue(config::NODE_VOLUME, value);
}

expected<std::vector<core::Mode>> FsapiDevice::modes() {
    auto items = listItems(config::NODE_VALID_MODES, config::MODE_LIST_MAX_ITEMS);
    if (!items) {
        return unexpected(items.error());
    }

    std::vector<core::Mode> result;
    result.reserve(items->size());
    for (const auto& item : *items) {
        core::Mode mode;
        mode.key = item.key;
        mode.id = trimmed(item.field("id"));
        mode.label = trimmed(item.field("label"));
        mode.selectable = item.field("selectable", "1") != "0";
        result.push_back(std::move(mode));
    }
    return result;
}

expected<void> FsapiDevice::setMode(const core::Mode& mode) {
    return setValue(config::NODE_MODE, mode.key);
}

expected<std::vector<core::Preset>> FsapiDevice::presets() {
    // Preset nodes are only readable with navigation enabled.
    if (auto nav = enableNavigation(); !nav) {
        return unexpected(nav.error());
    }

    auto items = listItems(config::NODE_PRESETS, config::PRESET_LIST_MAX_ITEMS);
    if (!items) {
        return unexpected(items.error());
    }

    std::vector<core::Preset> result;
    result.reserve(items->size());
    for (const auto& item : *items) {
        result.push_back(core::Preset{item.key, trimmed(item.field("name"))});
    }
    return result;
}

expected<void> FsapiDevice::recallPreset(const core::Preset& preset) {
    if (auto nav = enableNavigation(); !nav) {
        return nav;
    }
    return setValue(config::NODE_SELECT_PRESET, preset.token);
}

} // namespace fsremote::fsapi
