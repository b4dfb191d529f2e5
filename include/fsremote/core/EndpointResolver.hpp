#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fsremote::core {

/**
 * @brief Turns a user-typed radio address into candidate FSAPI base URLs.
 *
 * Rules, in order:
 * - Surrounding whitespace is ignored; blank input gives no candidates.
 * - "http://" is prepended unless the input already has an http(s) scheme.
 * - An input that already ends in "/device" or "/fsapi" (optionally with one
 *   trailing slash) is returned unchanged as the only candidate.
 * - Otherwise three candidates are produced, most specific first:
 *     host[:80]/device, host[:80]/fsapi, host
 *   where ":80" is only added when no port was given.
 * - Duplicates are removed, keeping the first occurrence.
 *
 * The resolver is pure: no DNS lookups, no sockets.
 */
class EndpointResolver {
public:
    static std::vector<std::string> resolve(std::string_view rawInput);

    /// True when @p url ends in a known FSAPI path root.
    static bool hasControlPath(std::string_view url);
};

} // namespace fsremote::core
