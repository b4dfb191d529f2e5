#include "fsremote/core/EndpointResolver.hpp"

#include "fsremote/fsapi/FsapiConfig.hpp"

#include <algorithm>
#include <cctype>

namespace fsremote::core {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

void appendUnique(std::vector<std::string>& out, std::string candidate) {
    if (std::find(out.begin(), out.end(), candidate) == out.end()) {
        out.push_back(std::move(candidate));
    }
}

} // namespace

bool EndpointResolver::hasControlPath(std::string_view url) {
    if (endsWith(url, "/")) {
        url.remove_suffix(1);
    }
    return endsWith(url, fsapi::config::DEVICE_PATH_ROOT)
        || endsWith(url, fsapi::config::FSAPI_PATH_ROOT);
}

std::vector<std::string> EndpointResolver::resolve(std::string_view rawInput) {
    const auto input = trim(rawInput);
    if (input.empty()) {
        return {};
    }

    std::string url;
    if (!startsWith(input, "http://") && !startsWith(input, "https://")) {
        url = "http://";
    }
    url.append(input);

    // Explicit control path: trust it.
    if (hasControlPath(url)) {
        return {url};
    }

    const auto authorityStart = url.find("://") + 3;
    std::string hostPort = url;
    while (hostPort.size() > authorityStart && hostPort.back() == '/') {
        hostPort.pop_back();
    }
    if (hostPort.size() <= authorityStart) {
        return {}; // scheme only, no host
    }

    const auto authority = std::string_view(hostPort).substr(authorityStart);
    const bool hasPort = authority.find(':') != std::string_view::npos;

    std::string base = hostPort;
    if (!hasPort) {
        base += ':';
        base += fsapi::config::DEFAULT_HTTP_PORT;
    }

    std::vector<std::string> candidates;
    candidates.reserve(3);
    appendUnique(candidates, base + std::string(fsapi::config::DEVICE_PATH_ROOT));
    appendUnique(candidates, base + std::string(fsapi::config::FSAPI_PATH_ROOT));
    appendUnique(candidates, hostPort);
    return candidates;
}

} // namespace fsremote::core
