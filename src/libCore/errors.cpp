#include "core/errors.hpp"

namespace ttt {

std::string_view toString(const MoveError error) {
	switch (error) {
	case MoveError::NotYourTurn:
		return "not_your_turn";
	case MoveError::CellOccupied:
		return "cell_occupied";
	case MoveError::GameOver:
		return "game_over";
	}
	return "unknown";
}

std::string_view describe(const MoveError error) {
	switch (error) {
	case MoveError::NotYourTurn:
		return "It is not your turn.";
	case MoveError::CellOccupied:
		return "Cell is already occupied.";
	case MoveError::GameOver:
		return "The game is already over.";
	}
	return "Unknown move error.";
}

std::optional<MoveError> moveErrorFromString(const std::string_view value) {
	for (const auto error : {MoveError::NotYourTurn, MoveError::CellOccupied, MoveError::GameOver}) {
		if (toString(error) == value) {
			return error;
		}
	}
	return std::nullopt;
}

} // namespace ttt
