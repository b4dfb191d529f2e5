#pragma once

#include <string_view>
#include <system_error>
#include <type_traits>

namespace fsremote::fsapi {

/**
 * @brief FSAPI protocol failures, reported through std::error_code.
 *
 * The first group mirrors the `<status>` values a radio returns; the second
 * covers HTTP-level and decoding problems detected on our side.
 */
enum class Errc {
    Fail = 1,            // FS_FAIL
    PacketBad,           // FS_PACKET_BAD
    NodeDoesNotExist,    // FS_NODE_DOES_NOT_EXIST
    NodeBlocked,         // FS_NODE_BLOCKED
    ListEnd,             // FS_LIST_END
    DeviceTimeout,       // FS_TIMEOUT
    UnknownStatus,

    InvalidPin,          // HTTP 403
    NoSession,           // HTTP 404 on a session call
    HttpStatus,          // any other non-2xx
    MalformedResponse,
    NoEndpoint           // device descriptor without <webfsapi>
};

const std::error_category& fsapi_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

/// Map an FSAPI `<status>` string; "FS_OK" maps to an empty error_code.
std::error_code statusToError(std::string_view status) noexcept;

} // namespace fsremote::fsapi

namespace std {
template <>
struct is_error_code_enum<fsremote::fsapi::Errc> : true_type {};
} // namespace std
