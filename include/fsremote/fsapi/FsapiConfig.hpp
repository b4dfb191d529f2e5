#pragma once

#include <cstddef>
#include <string_view>

namespace fsremote::fsapi::config {

/**
 * @brief Constants describing the Frontier Silicon FSAPI surface.
 *
 * Node names and path roots are fixed by the firmware; keeping them here
 * stops string literals from drifting across translation units.
 */

// Endpoints -------------------------------------------------------------------
constexpr std::string_view DEFAULT_HTTP_PORT = "80";
constexpr std::string_view DEVICE_PATH_ROOT = "/device";   // device descriptor
constexpr std::string_view FSAPI_PATH_ROOT = "/fsapi";     // control API root
constexpr std::string_view WEBFSAPI_ELEMENT = "webfsapi";

// Operations ------------------------------------------------------------------
constexpr std::string_view OP_CREATE_SESSION = "CREATE_SESSION";
constexpr std::string_view OP_GET = "GET";
constexpr std::string_view OP_SET = "SET";
constexpr std::string_view OP_LIST_GET_NEXT = "LIST_GET_NEXT";

// Nodes -----------------------------------------------------------------------
constexpr std::string_view NODE_FRIENDLY_NAME = "netRemote.sys.info.friendlyName";
constexpr std::string_view NODE_POWER = "netRemote.sys.power";
constexpr std::string_view NODE_VOLUME = "netRemote.sys.audio.volume";
constexpr std::string_view NODE_VALID_MODES = "netRemote.sys.caps.validModes";
constexpr std::string_view NODE_MODE = "netRemote.sys.mode";
constexpr std::string_view NODE_NAV_STATE = "netRemote.nav.state";
constexpr std::string_view NODE_PRESETS = "netRemote.nav.presets";
constexpr std::string_view NODE_SELECT_PRESET = "netRemote.nav.action.selectPreset";

// Lists (items requested per LIST_GET_NEXT page) -----------------------------
constexpr std::size_t MODE_LIST_MAX_ITEMS = 100;
constexpr std::size_t PRESET_LIST_MAX_ITEMS = 20;

} // namespace fsremote::fsapi::config
