#pragma once

#include "core/types.hpp"
#include "network/channel.hpp"

#include <chrono>

namespace ttt::gameNet {

inline constexpr std::chrono::milliseconds HANDSHAKE_TIMEOUT{5000};

//! Tell the peer which symbol is played through the relay client and wait for AssignRoleAck.
//! \note Throws NetworkError on timeout or a closed channel and LogicError if anything but the acknowledgement arrives.
void assignRole(network::Channel& channel, Symbol role, std::chrono::milliseconds timeout = HANDSHAKE_TIMEOUT);

//! Wait for the peer to assign the symbol played through the relay client, acknowledge it and return it.
//! \note Throws NetworkError on timeout or a closed channel and LogicError for a malformed AssignRole.
Symbol awaitRole(network::Channel& channel, std::chrono::milliseconds timeout = HANDSHAKE_TIMEOUT);

} // namespace ttt::gameNet
