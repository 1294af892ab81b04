#pragma once

#include "network/channel.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ttt::network {

//! Connect to a hosting peer and return a started channel.
//! \note Throws NetworkError if the host can not be resolved, refuses the connection or does not answer within timeout.
std::unique_ptr<Channel> connectToServer(const std::string& host, std::uint16_t port = DEFAULT_PORT,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace ttt::network
