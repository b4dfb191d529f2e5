#pragma once

#include "fsremote/core/Expected.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsremote::fsapi {

/**
 * @brief One `<item key="K">` entry of a LIST_GET_NEXT reply.
 */
struct FsapiListItem {
    int key = 0;
    std::map<std::string, std::string> fields; // field name -> unescaped text

    /// Field text, or @p fallback when the field is missing.
    std::string field(const std::string& name, const std::string& fallback = {}) const;
};

/**
 * @brief Decoded `<fsapiResponse>` document.
 *
 * A typical reply:
 * @code
 * <fsapiResponse>
 *   <status>FS_OK</status>
 *   <value><u8>1</u8></value>
 * </fsapiResponse>
 * @endcode
 * Only the handful of elements the remote needs are extracted; the decoder is
 * tolerant of extra whitespace and unknown elements.
 */
struct FsapiResponse {
    std::string status;                       // e.g. "FS_OK"
    std::optional<std::string> sessionId;     // CREATE_SESSION only
    std::optional<std::string> value;         // inner text of the typed <value> child
    std::string valueType;                    // "u8", "c8_array", ...
    std::vector<FsapiListItem> items;         // LIST_GET_NEXT only
    bool listEnd = false;                     // <listend/>: no page follows

    /// Empty for FS_OK, otherwise an fsapi::Errc code.
    std::error_code error() const;

    expected<std::string> text() const;
    expected<long long> integer() const;

    static expected<FsapiResponse> decode(std::string_view xml);
};

/**
 * @brief Read the FSAPI endpoint out of a `/device` descriptor document
 *        (`<netRemote>...<webfsapi>http://host:80/fsapi</webfsapi></netRemote>`).
 */
std::optional<std::string> findWebfsapiEndpoint(std::string_view descriptorXml);

namespace xml {

/// Inner text of the first `<tag ...>...</tag>` at or after @p from.
std::optional<std::string_view> extractElement(std::string_view doc,
                                               std::string_view tag,
                                               std::size_t from = 0);

/// Replace the five predefined XML entities and numeric character references.
std::string unescape(std::string_view text);

} // namespace xml

} // namespace fsremote::fsapi
