#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace ttt {

using Cell = std::optional<Symbol>;                                 //!< Empty or owned by a symbol.
using Grid = std::array<std::array<Cell, BOARD_SIZE>, BOARD_SIZE>; //!< Row major board snapshot.

//! \note Origin is the top left cell. Row and column start at 0.
class Board {
public:
	Board() = default;
	explicit Board(const Grid& grid);

	void setAt(Coord c, Symbol symbol); //!< Set at given coordinate (row, col) \in [0, 2]
	void clearAt(Coord c);              //!< Empty the cell at given coordinate.
	Cell getAt(Coord c) const;          //!< Get value at given coordinate (row, col) \in [0, 2]
	bool isFree(Coord c) const;         //!< Returns whether a certain board coordinate is free or occupied.

	//! Symbol owning a complete row, column or diagonal. Empty while nobody has three in a line.
	std::optional<Symbol> winner() const;
	bool isFull() const;

	std::vector<Coord> freeCells() const; //!< Free coordinates in row major order.
	const Grid& grid() const;

	bool operator==(const Board&) const = default;

private:
	Grid m_grid{}; //!< Cell values.
};

} // namespace ttt
