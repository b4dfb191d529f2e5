#include "fsremote/fsapi/FsapiError.hpp"

#include <string>

namespace fsremote::fsapi {

namespace {

class FsapiCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "fsapi"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::Fail:              return "device reported FS_FAIL";
            case Errc::PacketBad:         return "device rejected the request (FS_PACKET_BAD)";
            case Errc::NodeDoesNotExist:  return "node does not exist on this device";
            case Errc::NodeBlocked:       return "node is blocked in the current mode";
            case Errc::ListEnd:           return "end of list";
            case Errc::DeviceTimeout:     return "device timed out (FS_TIMEOUT)";
            case Errc::UnknownStatus:     return "unknown FSAPI status";
            case Errc::InvalidPin:        return "invalid PIN";
            case Errc::NoSession:         return "no such session or endpoint";
            case Errc::HttpStatus:        return "unexpected HTTP status";
            case Errc::MalformedResponse: return "malformed FSAPI response";
            case Errc::NoEndpoint:        return "device descriptor has no webfsapi endpoint";
        }
        return "unknown fsapi error";
    }
};

} // namespace

const std::error_category& fsapi_category() noexcept {
    static const FsapiCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), fsapi_category()};
}

std::error_code statusToError(std::string_view status) noexcept {
    if (status == "FS_OK")                  return {};
    if (status == "FS_FAIL")                return Errc::Fail;
    if (status == "FS_PACKET_BAD")          return Errc::PacketBad;
    if (status == "FS_NODE_DOES_NOT_EXIST") return Errc::NodeDoesNotExist;
    if (status == "FS_NODE_BLOCKED")        return Errc::NodeBlocked;
    if (status == "FS_LIST_END")            return Errc::ListEnd;
    if (status == "FS_TIMEOUT")             return Errc::DeviceTimeout;
    return Errc::UnknownStatus;
}

} // namespace fsremote::fsapi
