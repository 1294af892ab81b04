#pragma once

#include <optional>
#include <string_view>

namespace ttt {

inline constexpr int BOARD_SIZE = 3; //!< Rows and columns of the board.

//! Coordinate pair for the board.
//! \note Signed so that out of range requests coming from the network can be represented and rejected.
struct Coord {
	int row, col;

	bool operator==(const Coord&) const = default;
};

enum class Symbol { X = 1, O = 2 };

//! Returns the opponent enum value of input symbol.
inline constexpr Symbol opponent(Symbol symbol) {
	return symbol == Symbol::X ? Symbol::O : Symbol::X;
}

//! Returns whether a coordinate lies on the board.
inline constexpr bool isInside(Coord c) {
	return c.row >= 0 && c.row < BOARD_SIZE && c.col >= 0 && c.col < BOARD_SIZE;
}

inline constexpr std::string_view toString(Symbol symbol) {
	return symbol == Symbol::X ? "X" : "O";
}

//! Parses "X" or "O". Anything else yields an empty optional.
inline constexpr std::optional<Symbol> symbolFromString(std::string_view value) {
	if (value == "X") {
		return Symbol::X;
	}
	if (value == "O") {
		return Symbol::O;
	}
	return std::nullopt;
}

} // namespace ttt
