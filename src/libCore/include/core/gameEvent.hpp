#pragma once

#include "core/board.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace ttt {

//! A participant asks to place its symbol.
struct MoveRequested {
	Symbol player;
	Coord c;
};

//! Full board snapshot after a change.
struct StateUpdated {
	Grid board;
	Symbol currentPlayer;
	std::optional<Symbol> winner;
};

//! It is now this player's turn.
struct StartTurn {
	Symbol player;
	Grid board;
};

//! A move request was rejected.
struct InvalidMove {
	MoveRequested request;
	MoveError error;
	std::string message;
};

//! Front end of a local participant may accept input now.
struct EnableInput {
	Symbol player;
};

//! Shown to the local participant whose move was rejected.
struct InputError {
	Symbol player;
	std::string message;
};

//! The connection to the peer is gone. No further remote events will arrive.
struct ConnectionLost {
	std::string reason;
};

} // namespace ttt
