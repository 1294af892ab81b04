#include "core/turnEngine.hpp"

#include "../helpers/eventRecorder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace ttt::gtest {

TEST(TurnEngine, StartPublishesStateThenTurn) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);

	engine.start();

	EXPECT_EQ(recorder.sequence(), (std::vector<std::string>{"StateUpdated", "StartTurn:X"}));
	const auto states = recorder.states();
	ASSERT_EQ(states.size(), 1u);
	EXPECT_EQ(states[0].currentPlayer, Symbol::X);
	EXPECT_FALSE(states[0].winner.has_value());
	EXPECT_EQ(Board(states[0].board), Board());
}

TEST(TurnEngine, PlayersAlternate) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	const std::vector<Coord> moves{{0, 0}, {0, 1}, {0, 2}, {1, 1}};
	Symbol player = Symbol::X;
	for (std::size_t i = 0; i < moves.size(); ++i) {
		bus.publish(MoveRequested{player, moves[i]});
		player = opponent(player);
		EXPECT_EQ(engine.currentPlayer(), i % 2 == 0 ? Symbol::O : Symbol::X);
	}

	EXPECT_EQ(recorder.sequence(), (std::vector<std::string>{"StateUpdated", "StartTurn:X", "StateUpdated", "StartTurn:O", "StateUpdated",
	                                                         "StartTurn:X", "StateUpdated", "StartTurn:O", "StateUpdated", "StartTurn:X"}));
	EXPECT_TRUE(recorder.invalidMoves().empty());
}

TEST(TurnEngine, OccupiedCellIsRejected) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	bus.publish(MoveRequested{Symbol::X, {1, 1}});
	const auto before = engine.board();

	bus.publish(MoveRequested{Symbol::O, {1, 1}});

	EXPECT_EQ(engine.board(), before);
	EXPECT_EQ(engine.currentPlayer(), Symbol::O);

	const auto invalid = recorder.invalidMoves();
	ASSERT_EQ(invalid.size(), 1u);
	EXPECT_EQ(invalid[0].error, MoveError::CellOccupied);
	EXPECT_EQ(invalid[0].request.player, Symbol::O);
	EXPECT_FALSE(invalid[0].message.empty());

	// Rejection re-announces the same turn.
	const auto sequence = recorder.sequence();
	ASSERT_GE(sequence.size(), 2u);
	EXPECT_EQ(sequence[sequence.size() - 2], "InvalidMove:cell_occupied");
	EXPECT_EQ(sequence.back(), "StartTurn:O");
}

TEST(TurnEngine, NotYourTurn) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	bus.publish(MoveRequested{Symbol::O, {0, 0}});

	EXPECT_TRUE(engine.board().isFree({0, 0}));
	ASSERT_EQ(recorder.invalidMoves().size(), 1u);
	EXPECT_EQ(recorder.invalidMoves()[0].error, MoveError::NotYourTurn);
	EXPECT_EQ(recorder.turns().back().player, Symbol::X);
}

TEST(TurnEngine, OutOfBoundsIsLogicError) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	EXPECT_THROW(bus.publish(MoveRequested{Symbol::X, {3, 0}}), LogicError);
	EXPECT_THROW(bus.publish(MoveRequested{Symbol::X, {0, -1}}), LogicError);

	EXPECT_EQ(engine.board(), Board());
	EXPECT_EQ(engine.currentPlayer(), Symbol::X);
	EXPECT_TRUE(recorder.invalidMoves().empty());
	EXPECT_EQ(recorder.states().size(), 1u);
}

TEST(TurnEngine, TurnIsCheckedBeforeBounds) {
	EventBus bus;
	TurnEngine engine(bus);

	EXPECT_EQ(engine.applyMove(MoveRequested{Symbol::O, {7, 7}}), MoveError::NotYourTurn);
	EXPECT_THROW(engine.applyMove(MoveRequested{Symbol::X, {7, 7}}), LogicError);
}

TEST(TurnEngine, DiagonalWin) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	bus.publish(MoveRequested{Symbol::X, {0, 0}});
	bus.publish(MoveRequested{Symbol::O, {1, 0}});
	bus.publish(MoveRequested{Symbol::X, {1, 1}});
	bus.publish(MoveRequested{Symbol::O, {0, 1}});
	bus.publish(MoveRequested{Symbol::X, {2, 2}});

	EXPECT_EQ(engine.winner(), Symbol::X);
	EXPECT_TRUE(engine.isOver());
	EXPECT_TRUE(recorder.invalidMoves().empty());

	// Initial state plus one per move.
	const auto states = recorder.states();
	ASSERT_EQ(states.size(), 6u);
	EXPECT_EQ(states.back().winner, Symbol::X);

	// Five moves were applied, so O is to move even though the game is over.
	EXPECT_EQ(engine.currentPlayer(), Symbol::O);
	EXPECT_EQ(states.back().currentPlayer, Symbol::O);

	// No turn after the game ended.
	EXPECT_EQ(recorder.sequence().back(), "StateUpdated");
	EXPECT_EQ(recorder.turns().size(), 5u);
}

TEST(TurnEngine, MovesAfterGameOverAreRejected) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	for (const auto& [player, c] : std::vector<std::pair<Symbol, Coord>>{
	             {Symbol::X, {0, 0}}, {Symbol::O, {1, 0}}, {Symbol::X, {0, 1}}, {Symbol::O, {1, 1}}, {Symbol::X, {0, 2}}}) {
		bus.publish(MoveRequested{player, c});
	}
	ASSERT_EQ(engine.winner(), Symbol::X);
	const auto turns = recorder.turns().size();

	bus.publish(MoveRequested{Symbol::X, {2, 2}});
	bus.publish(MoveRequested{Symbol::O, {2, 2}});

	const auto invalid = recorder.invalidMoves();
	// The turn passed to O with the winning move. The turn is checked before the outcome.
	ASSERT_EQ(invalid.size(), 2u);
	EXPECT_EQ(invalid[0].error, MoveError::NotYourTurn);
	EXPECT_EQ(invalid[1].error, MoveError::GameOver);
	EXPECT_TRUE(engine.board().isFree({2, 2}));
	EXPECT_EQ(recorder.turns().size(), turns);
}

TEST(TurnEngine, DrawEndsGame) {
	EventBus bus;
	TurnEngine engine(bus);
	EventRecorder recorder(bus);
	engine.start();

	// X O X
	// X O O
	// O X X
	const std::vector<Coord> moves{{0, 0}, {0, 1}, {0, 2}, {1, 1}, {1, 0}, {1, 2}, {2, 1}, {2, 0}, {2, 2}};
	Symbol player = Symbol::X;
	for (const auto c : moves) {
		bus.publish(MoveRequested{player, c});
		player = opponent(player);
	}

	EXPECT_TRUE(engine.isOver());
	EXPECT_FALSE(engine.winner().has_value());
	EXPECT_TRUE(engine.board().isFull());
	EXPECT_EQ(recorder.states().size(), 10u);
	EXPECT_EQ(recorder.sequence().back(), "StateUpdated");
}

TEST(TurnEngine, MirrorAdoptsSnapshots) {
	EventBus bus;
	TurnEngine engine(bus, EngineMode::Mirror);

	EXPECT_THROW(engine.start(), LogicError);

	Board board;
	board.setAt({2, 0}, Symbol::X);
	bus.publish(StateUpdated{board.grid(), Symbol::O, std::nullopt});

	EXPECT_EQ(engine.board(), board);
	EXPECT_EQ(engine.currentPlayer(), Symbol::O);

	// Move requests belong to the authoritative side.
	bus.publish(MoveRequested{Symbol::O, {0, 0}});
	EXPECT_TRUE(engine.board().isFree({0, 0}));
}

} // namespace ttt::gtest
