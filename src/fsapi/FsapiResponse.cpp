#include "fsremote/fsapi/FsapiResponse.hpp"

#include "fsremote/fsapi/FsapiConfig.hpp"
#include "fsremote/fsapi/FsapiError.hpp"

#include <charconv>
#include <cstdint>
#include <utility>

namespace fsremote::fsapi {

namespace {

bool isNameEnd(char c) {
    return c == '>' || c == '/' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trimWs(std::string_view s) {
    const auto ws = [](char c){ return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && ws(s.front())) s.remove_prefix(1);
    while (!s.empty() && ws(s.back())) s.remove_suffix(1);
    return s;
}

struct Element {
    std::string_view openTag;   // "<item key=\"3\">" without the angle brackets
    std::string_view inner;
    std::size_t end = 0;        // index just past the closing tag
};

std::optional<Element> findElement(std::string_view doc, std::string_view tag, std::size_t from) {
    std::size_t pos = from;
    for (;;) {
        pos = doc.find('<', pos);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        const auto nameStart = pos + 1;
        if (doc.compare(nameStart, tag.size(), tag) == 0
            && nameStart + tag.size() < doc.size()
            && isNameEnd(doc[nameStart + tag.size()])) {
            break;
        }
        pos = nameStart;
    }

    const auto tagClose = doc.find('>', pos);
    if (tagClose == std::string_view::npos) {
        return std::nullopt;
    }

    Element element;
    element.openTag = doc.substr(pos + 1, tagClose - pos - 1);
    if (!element.openTag.empty() && element.openTag.back() == '/') {
        element.end = tagClose + 1; // <tag/>
        return element;
    }

    const std::string closing = "</" + std::string(tag) + ">";
    const auto innerStart = tagClose + 1;
    const auto closePos = doc.find(closing, innerStart);
    if (closePos == std::string_view::npos) {
        return std::nullopt;
    }
    element.inner = doc.substr(innerStart, closePos - innerStart);
    element.end = closePos + closing.size();
    return element;
}

std::optional<std::string_view> attribute(std::string_view openTag, std::string_view name) {
    const std::string needle = std::string(name) + "=\"";
    const auto start = openTag.find(needle);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    const auto valueStart = start + needle.size();
    const auto valueEnd = openTag.find('"', valueStart);
    if (valueEnd == std::string_view::npos) {
        return std::nullopt;
    }
    return openTag.substr(valueStart, valueEnd - valueStart);
}

// "<u8>1</u8>" -> {"u8", "1"}
std::optional<std::pair<std::string, std::string>> typedValue(std::string_view content) {
    content = trimWs(content);
    if (content.size() < 2 || content.front() != '<') {
        return std::nullopt;
    }
    std::size_t nameEnd = 1;
    while (nameEnd < content.size() && !isNameEnd(content[nameEnd])) {
        ++nameEnd;
    }
    const auto type = content.substr(1, nameEnd - 1);
    const auto element = findElement(content, type, 0);
    if (!element) {
        return std::nullopt;
    }
    return std::make_pair(std::string(type), xml::unescape(element->inner));
}

template <typename T>
bool parseInteger(std::string_view text, T& out) {
    text = trimWs(text);
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, out);
    return ec == std::errc{} && ptr == last;
}

} // namespace

namespace xml {

std::optional<std::string_view> extractElement(std::string_view doc,
                                               std::string_view tag,
                                               std::size_t from) {
    auto element = findElement(doc, tag, from);
    if (!element) {
        return std::nullopt;
    }
    return element->inner;
}

std::string unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }
        const auto semi = text.find(';', i);
        if (semi == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        const auto entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp")       out.push_back('&');
        else if (entity == "lt")   out.push_back('<');
        else if (entity == "gt")   out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else if (!entity.empty() && entity.front() == '#') {
            std::uint32_t code = 0;
            const bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
            const auto digits = entity.substr(hex ? 2 : 1);
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                                   code, hex ? 16 : 10);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()
                || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
                out.append(text.substr(i, semi - i + 1)); // not a Unicode scalar, keep verbatim
            } else if (code < 0x80) {
                out.push_back(static_cast<char>(code));
            } else if (code < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (code >> 6)));
                out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            } else if (code < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (code >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (code >> 18)));
                out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            }
        } else {
            out.append(text.substr(i, semi - i + 1)); // unknown entity, keep verbatim
        }
        i = semi + 1;
    }
    return out;
}

} // namespace xml

std::string FsapiListItem::field(const std::string& name, const std::string& fallback) const {
    auto it = fields.find(name);
    return it == fields.end() ? fallback : it->second;
}

std::error_code FsapiResponse::error() const {
    return statusToError(status);
}

expected<std::string> FsapiResponse::text() const {
    if (auto ec = error(); ec) {
        return unexpected(ec);
    }
    if (!value) {
        return unexpected(make_error_code(Errc::MalformedResponse));
    }
    return *value;
}

expected<long long> FsapiResponse::integer() const {
    if (auto ec = error(); ec) {
        return unexpected(ec);
    }
    long long result = 0;
    if (!value || !parseInteger(*value, result)) {
        return unexpected(make_error_code(Errc::MalformedResponse));
    }
    return result;
}

expected<FsapiResponse> FsapiResponse::decode(std::string_view doc) {
    auto root = findElement(doc, "fsapiResponse", 0);
    if (!root) {
        return unexpected(make_error_code(Errc::MalformedResponse));
    }
    const auto body = root->inner;

    auto status = xml::extractElement(body, "status");
    if (!status) {
        return unexpected(make_error_code(Errc::MalformedResponse));
    }

    FsapiResponse response;
    response.status = std::string(trimWs(*status));

    if (auto sid = xml::extractElement(body, "sessionId")) {
        response.sessionId = std::string(trimWs(*sid));
    }

    if (auto value = xml::extractElement(body, "value")) {
        if (auto typed = typedValue(*value)) {
            response.valueType = std::move(typed->first);
            response.value = std::move(typed->second);
        }
    }

    std::size_t pos = 0;
    while (auto item = findElement(body, "item", pos)) {
        pos = item->end;

        FsapiListItem entry;
        const auto key = attribute(item->openTag, "key");
        if (!key || !parseInteger(*key, entry.key)) {
            return unexpected(make_error_code(Errc::MalformedResponse));
        }

        std::size_t fieldPos = 0;
        while (auto field = findElement(item->inner, "field", fieldPos)) {
            fieldPos = field->end;
            const auto name = attribute(field->openTag, "name");
            if (!name) {
                continue;
            }
            auto typed = typedValue(field->inner);
            entry.fields[std::string(*name)] = typed ? std::move(typed->second) : std::string{};
        }
        response.items.push_back(std::move(entry));
    }
    response.listEnd = findElement(body, "listend", 0).has_value();

    return response;
}

std::optional<std::string> findWebfsapiEndpoint(std::string_view descriptorXml) {
    auto endpoint = xml::extractElement(descriptorXml, config::WEBFSAPI_ELEMENT);
    if (!endpoint) {
        return std::nullopt;
    }
    auto text = xml::unescape(trimWs(*endpoint));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

} // namespace fsremote::fsapi
