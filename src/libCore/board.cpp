#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace ttt {

namespace {

//! Every row, column and diagonal.
constexpr std::array<std::array<Coord, BOARD_SIZE>, 8> LINES{{
        {{{0, 0}, {0, 1}, {0, 2}}},
        {{{1, 0}, {1, 1}, {1, 2}}},
        {{{2, 0}, {2, 1}, {2, 2}}},
        {{{0, 0}, {1, 0}, {2, 0}}},
        {{{0, 1}, {1, 1}, {2, 1}}},
        {{{0, 2}, {1, 2}, {2, 2}}},
        {{{0, 0}, {1, 1}, {2, 2}}},
        {{{0, 2}, {1, 1}, {2, 0}}},
}};

} // namespace

Board::Board(const Grid& grid) : m_grid(grid) {}

void Board::setAt(const Coord c, const Symbol symbol) {
	assert(isInside(c)); // Engine checks bounds before setting

	m_grid[c.row][c.col] = symbol;
}

void Board::clearAt(const Coord c) {
	assert(isInside(c));

	m_grid[c.row][c.col].reset();
}

Cell Board::getAt(const Coord c) const {
	assert(isInside(c));

	return m_grid[c.row][c.col];
}

bool Board::isFree(const Coord c) const {
	return !getAt(c).has_value();
}

std::optional<Symbol> Board::winner() const {
	for (const auto& line : LINES) {
		const auto first = getAt(line[0]);
		if (first && getAt(line[1]) == first && getAt(line[2]) == first) {
			return first;
		}
	}
	return std::nullopt;
}

bool Board::isFull() const {
	return std::ranges::all_of(m_grid, [](const auto& row) { return std::ranges::all_of(row, [](const Cell& cell) { return cell.has_value(); }); });
}

std::vector<Coord> Board::freeCells() const {
	std::vector<Coord> cells;
	for (int row = 0; row < BOARD_SIZE; ++row) {
		for (int col = 0; col < BOARD_SIZE; ++col) {
			if (!m_grid[row][col]) {
				cells.push_back({row, col});
			}
		}
	}
	return cells;
}

const Grid& Board::grid() const {
	return m_grid;
}

} // namespace ttt
