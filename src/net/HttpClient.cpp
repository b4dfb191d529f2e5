#include "fsremote/net/HttpClient.hpp"

#include "fsremote/log/Log.hpp"
#include "fsremote/net/Deadline.hpp"
#include "fsremote/net/NetService.hpp"
#include "fsremote/net/TcpClient.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <memory>

namespace fsremote::net {

namespace {

constexpr std::size_t kMaxResponseBytes = 1024 * 1024;

// Time left until @p deadline, never negative.
TimeoutConfig::duration remaining(HttpClient::clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<TimeoutConfig::duration>(
        deadline - HttpClient::clock::now());
    return left.count() > 0 ? left : TimeoutConfig::duration::zero();
}

std::error_code protocolError() {
    return std::make_error_code(std::errc::protocol_error);
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

expected<std::string> decodeChunked(std::string_view body) {
    std::string out;
    for (;;) {
        const auto lineEnd = body.find("\r\n");
        if (lineEnd == std::string_view::npos) {
            return unexpected(protocolError());
        }
        auto sizeField = body.substr(0, lineEnd);
        if (const auto ext = sizeField.find(';'); ext != std::string_view::npos) {
            sizeField = sizeField.substr(0, ext);
        }
        sizeField = trim(sizeField);

        std::size_t chunkSize = 0;
        const auto* first = sizeField.data();
        const auto* last = sizeField.data() + sizeField.size();
        const auto [ptr, ec] = std::from_chars(first, last, chunkSize, 16);
        if (ec != std::errc{} || ptr != last) {
            return unexpected(protocolError());
        }

        body.remove_prefix(lineEnd + 2);
        if (chunkSize == 0) {
            return out;
        }
        if (body.size() < chunkSize + 2) {
            return unexpected(protocolError());
        }
        out.append(body.substr(0, chunkSize));
        body.remove_prefix(chunkSize + 2);
    }
}

} // namespace

expected<Url> Url::parse(std::string_view text) {
    text = trim(text);

    if (const auto schemeEnd = text.find("://"); schemeEnd != std::string_view::npos) {
        if (toLower(text.substr(0, schemeEnd)) != "http") {
            return unexpected(std::make_error_code(std::errc::protocol_not_supported));
        }
        text.remove_prefix(schemeEnd + 3);
    }

    const auto pathStart = text.find_first_of("/?");
    auto authority = text.substr(0, pathStart);

    Url url;
    if (pathStart != std::string_view::npos) {
        url.target = std::string(text.substr(pathStart));
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal: [addr]:port
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return unexpected(std::make_error_code(std::errc::invalid_argument));
        }
        url.host = std::string(authority.substr(1, close - 1));
        const auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return unexpected(std::make_error_code(std::errc::invalid_argument));
            }
            url.port = std::string(rest.substr(1));
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        url.host = std::string(authority.substr(0, colon));
        url.port = std::string(authority.substr(colon + 1));
    } else {
        url.host = std::string(authority);
    }

    if (url.host.empty() || url.port.empty()) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return url;
}

expected<HttpResponse> HttpResponse::parse(std::string_view raw) {
    const auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string_view::npos) {
        return unexpected(protocolError());
    }

    auto head = raw.substr(0, headerEnd);
    auto body = raw.substr(headerEnd + 4);

    auto lineEnd = head.find("\r\n");
    const auto statusLine = head.substr(0, lineEnd);
    head = (lineEnd == std::string_view::npos) ? std::string_view{} : head.substr(lineEnd + 2);

    // "HTTP/1.1 200 OK"
    if (statusLine.substr(0, 5) != "HTTP/") {
        return unexpected(protocolError());
    }
    const auto codeStart = statusLine.find(' ');
    if (codeStart == std::string_view::npos || statusLine.size() < codeStart + 4) {
        return unexpected(protocolError());
    }

    HttpResponse response;
    const auto codeText = statusLine.substr(codeStart + 1, 3);
    const auto [ptr, ec] = std::from_chars(codeText.data(), codeText.data() + codeText.size(),
                                           response.status);
    if (ec != std::errc{} || ptr != codeText.data() + codeText.size()) {
        return unexpected(protocolError());
    }

    while (!head.empty()) {
        lineEnd = head.find("\r\n");
        const auto line = head.substr(0, lineEnd);
        head = (lineEnd == std::string_view::npos) ? std::string_view{} : head.substr(lineEnd + 2);

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        response.headers[toLower(trim(line.substr(0, colon)))] =
            std::string(trim(line.substr(colon + 1)));
    }

    if (auto te = response.headers.find("transfer-encoding");
        te != response.headers.end() && toLower(te->second).find("chunked") != std::string::npos) {
        auto decoded = decodeChunked(body);
        if (!decoded) {
            return unexpected(decoded.error());
        }
        response.body = std::move(*decoded);
        return response;
    }

    if (auto cl = response.headers.find("content-length"); cl != response.headers.end()) {
        std::size_t length = 0;
        const auto& text = cl->second;
        const auto [lp, lec] = std::from_chars(text.data(), text.data() + text.size(), length);
        if (lec != std::errc{} || lp != text.data() + text.size()) {
            return unexpected(protocolError());
        }
        if (body.size() < length) {
            return unexpected(protocolError()); // truncated
        }
        body = body.substr(0, length);
    }

    response.body = std::string(body);
    return response;
}

HttpClient::HttpClient(TimeoutConfig::duration timeout)
: timeout_(timeout.count() < 0 ? TimeoutConfig::duration::zero() : timeout)
{}

expected<HttpResponse> HttpClient::get(const std::string& text) const {
    return get(text, clock::now() + timeout_);
}

expected<HttpResponse> HttpClient::get(const std::string& text, clock::time_point deadline) const {
    auto url = Url::parse(text);
    if (!url) {
        logDebug("[HttpClient] bad url '", text, "': ", url.error().message(), "\n");
        return unexpected(url.error());
    }

    const auto expired = [&]{
        logDebug("[HttpClient] deadline passed for ", text, "\n");
        return unexpected(error_code(asio::error::timed_out));
    };

    // Resolve asynchronously so a slow DNS answer counts against the deadline.
    auto io = shared_io_context();
    auto resolver = std::make_shared<tcp::resolver>(asio::make_strand(*io));
    auto results = std::make_shared<tcp::resolver::results_type>();
    error_code ec = with_deadline(resolver->get_executor(), remaining(deadline),
        [&](auto completion){
            resolver->async_resolve(url->host, url->port,
                [resolver, results, completion](const error_code& rec,
                                                tcp::resolver::results_type found){
                    *results = std::move(found);
                    completion(rec);
                });
        },
        [resolver]{ resolver->cancel(); }
    );
    if (ec) {
        logDebug("[HttpClient] resolve ", url->host, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }

    if (remaining(deadline).count() == 0) {
        return expired();
    }
    TcpClient client(remaining(deadline));
    if (ec = client.connect(*results); ec) {
        return unexpected(ec);
    }

    std::string request;
    request.reserve(160 + url->target.size());
    request += "GET ";
    request += url->target;
    request += " HTTP/1.0\r\nHost: ";
    request += url->host;
    if (url->port != "80") {
        request += ':';
        request += url->port;
    }
    request += "\r\nUser-Agent: fsremote\r\nAccept: */*\r\nConnection: close\r\n\r\n";

    logDebug("[HttpClient] GET ", text, "\n");

    if (remaining(deadline).count() == 0) {
        return expired();
    }
    client.setTimeout(remaining(deadline));
    if (ec = client.write_all(request.data(), request.size()); ec) {
        return unexpected(ec);
    }

    std::string raw;
    for (;;) {
        const auto left = remaining(deadline);
        if (left.count() == 0) {
            return expired();
        }
        client.setTimeout(left);
        ec = client.read_some(raw);
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            return unexpected(ec);
        }
        if (raw.size() > kMaxResponseBytes) {
            return unexpected(std::make_error_code(std::errc::message_size));
        }
    }
    client.close();

    auto response = HttpResponse::parse(raw);
    if (!response) {
        logDebug("[HttpClient] malformed response from ", text, "\n");
        return response;
    }
    logDebug("[HttpClient] ", response->status, " (", response->body.size(), " bytes)\n");
    return response;
}

std::string urlEncode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned>(c));
            out.append(buf);
        }
    }
    return out;
}

} // namespace fsremote::net
