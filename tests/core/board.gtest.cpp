#include "core/board.hpp"

#include <gtest/gtest.h>

#include <array>

namespace ttt::gtest {

TEST(Board, EmptyBoard) {
	const Board board;

	EXPECT_FALSE(board.winner().has_value());
	EXPECT_FALSE(board.isFull());
	EXPECT_EQ(board.freeCells().size(), 9u);
	EXPECT_TRUE(board.isFree({2, 2}));
}

TEST(Board, EveryLineWins) {
	const std::array<std::array<Coord, 3>, 8> lines{{
	        {{{0, 0}, {0, 1}, {0, 2}}},
	        {{{1, 0}, {1, 1}, {1, 2}}},
	        {{{2, 0}, {2, 1}, {2, 2}}},
	        {{{0, 0}, {1, 0}, {2, 0}}},
	        {{{0, 1}, {1, 1}, {2, 1}}},
	        {{{0, 2}, {1, 2}, {2, 2}}},
	        {{{0, 0}, {1, 1}, {2, 2}}},
	        {{{0, 2}, {1, 1}, {2, 0}}},
	}};

	for (const auto& line : lines) {
		Board board;
		board.setAt(line[0], Symbol::O);
		board.setAt(line[1], Symbol::O);
		EXPECT_FALSE(board.winner().has_value());

		board.setAt(line[2], Symbol::O);
		ASSERT_TRUE(board.winner().has_value());
		EXPECT_EQ(*board.winner(), Symbol::O);
	}
}

TEST(Board, MixedLineDoesNotWin) {
	Board board;
	board.setAt({0, 0}, Symbol::X);
	board.setAt({0, 1}, Symbol::O);
	board.setAt({0, 2}, Symbol::X);

	EXPECT_FALSE(board.winner().has_value());
}

TEST(Board, FullBoardWithoutWinner) {
	// X O X
	// X O O
	// O X X
	Board board;
	board.setAt({0, 0}, Symbol::X);
	board.setAt({0, 1}, Symbol::O);
	board.setAt({0, 2}, Symbol::X);
	board.setAt({1, 0}, Symbol::X);
	board.setAt({1, 1}, Symbol::O);
	board.setAt({1, 2}, Symbol::O);
	board.setAt({2, 0}, Symbol::O);
	board.setAt({2, 1}, Symbol::X);
	board.setAt({2, 2}, Symbol::X);

	EXPECT_TRUE(board.isFull());
	EXPECT_FALSE(board.winner().has_value());
	EXPECT_TRUE(board.freeCells().empty());
}

TEST(Board, ClearAndGrid) {
	Board board;
	board.setAt({1, 2}, Symbol::X);
	EXPECT_EQ(board.grid()[1][2], Symbol::X);
	EXPECT_FALSE(board.isFree({1, 2}));

	board.clearAt({1, 2});
	EXPECT_TRUE(board.isFree({1, 2}));
	EXPECT_EQ(Board(board.grid()), board);
}

TEST(Types, SymbolConversion) {
	EXPECT_EQ(opponent(Symbol::X), Symbol::O);
	EXPECT_EQ(opponent(Symbol::O), Symbol::X);
	EXPECT_EQ(toString(Symbol::X), "X");
	EXPECT_EQ(symbolFromString("O"), Symbol::O);
	EXPECT_FALSE(symbolFromString("x").has_value());
	EXPECT_FALSE(symbolFromString("").has_value());

	EXPECT_TRUE(isInside({0, 2}));
	EXPECT_FALSE(isInside({3, 0}));
	EXPECT_FALSE(isInside({0, -1}));
}

} // namespace ttt::gtest
