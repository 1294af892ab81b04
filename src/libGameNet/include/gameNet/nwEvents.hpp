#pragma once

#include "core/gameEvent.hpp"
#include "network/protocol.hpp"

#include <optional>
#include <string_view>
#include <variant>

namespace ttt::gameNet {

inline constexpr std::string_view MSG_ASSIGN_ROLE     = "AssignRole";
inline constexpr std::string_view MSG_ASSIGN_ROLE_ACK = "AssignRoleAck";
inline constexpr std::string_view MSG_MOVE_REQUESTED  = "MoveRequested";
inline constexpr std::string_view MSG_STATE_UPDATED   = "StateUpdated";
inline constexpr std::string_view MSG_START_TURN      = "StartTurn";
inline constexpr std::string_view MSG_INVALID_MOVE    = "InvalidMove";

//! The receiver plays `role` for the rest of the session.
struct NwAssignRole {
	Symbol role;
};
struct NwAssignRoleAck {};

//! Everything that crosses the bridge. Game events travel unchanged.
using NwEvent = std::variant<NwAssignRole, NwAssignRoleAck, MoveRequested, StateUpdated, StartTurn, InvalidMove>;

//! Network event to frame.
network::Frame toFrame(const NwEvent& event);

//! Frame to network event. Empty for unknown types, missing or unexpected fields and values of the wrong type.
std::optional<NwEvent> fromFrame(const network::Frame& frame);

} // namespace ttt::gameNet
