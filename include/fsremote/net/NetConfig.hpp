#pragma once

#include <asio.hpp>
#include <system_error>

namespace fsremote::net {

/**
 * @brief Networking aliases so the rest of fsremote names Asio in one place.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;

} // namespace fsremote::net
