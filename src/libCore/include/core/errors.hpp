#pragma once

#include <optional>
#include <stdexcept>
#include <string_view>

namespace ttt {

//! Base of all errors raised by the tic-tac-toe libraries.
class GameError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Programming or protocol errors. Not recoverable by the player.
class LogicError : public GameError {
public:
	using GameError::GameError;
};

//! Transport failures, timeouts and lost peers.
class NetworkError : public GameError {
public:
	using GameError::GameError;
};

//! Reasons for rejecting a move request. These are reported to the player and the game goes on.
enum class MoveError { NotYourTurn, CellOccupied, GameOver };

//! Machine readable name used on the wire.
std::string_view toString(MoveError error);
//! Human readable description.
std::string_view describe(MoveError error);
std::optional<MoveError> moveErrorFromString(std::string_view value);

} // namespace ttt
