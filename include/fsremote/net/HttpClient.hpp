#pragma once
#include "fsremote/core/Expected.hpp"
#include "fsremote/net/TimeoutConfig.hpp"

#include <chrono>

#include <map>
#include <string>
#include <string_view>

namespace fsremote::net {

/**
 * @brief Components of an "http://host[:port]/target" URL.
 */
struct Url {
    std::string host;
    std::string port = "80";
    std::string target = "/";

    /// Plain HTTP only; https and other schemes yield protocol_not_supported.
    static expected<Url> parse(std::string_view text);
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers; // keys lower-cased
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }

    /// Split a raw HTTP/1.x response into status, headers and (de-chunked) body.
    static expected<HttpResponse> parse(std::string_view raw);
};

/**
 * @brief Minimal blocking HTTP/1.0 GET client on top of `TcpClient`.
 *
 * Each request opens a fresh connection and reads until the server closes it
 * (radios answer with `Connection: close` anyway). The whole request, from
 * name resolution to the last byte, shares one deadline; once it passes the
 * request fails with `asio::error::timed_out`.
 */
class HttpClient {
public:
    using clock = std::chrono::steady_clock;

    explicit HttpClient(TimeoutConfig::duration timeout = TimeoutConfig::defaultTimeout());

    /// Bounded by the client timeout, counted from now.
    expected<HttpResponse> get(const std::string& url) const;

    /// Bounded by @p deadline, so several requests can share one budget.
    expected<HttpResponse> get(const std::string& url, clock::time_point deadline) const;

    TimeoutConfig::duration timeout() const { return timeout_; }

private:
    TimeoutConfig::duration timeout_;
};

/// Percent-encode a query parameter value.
std::string urlEncode(std::string_view value);

} // namespace fsremote::net
