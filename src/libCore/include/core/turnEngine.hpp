#pragma once

#include "core/board.hpp"
#include "core/eventBus.hpp"
#include "core/gameEvent.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace ttt {

enum class EngineMode {
	Authoritative, //!< Validates MoveRequested and publishes the resulting state.
	Mirror,        //!< Adopts StateUpdated snapshots of a remote authoritative engine.
};

//! Owns the board, the side to move and the outcome of one game.
//! In authoritative mode the engine reacts to MoveRequested on the bus and publishes
//! StateUpdated, StartTurn and InvalidMove. Events are published after the state lock is released.
class TurnEngine {
public:
	explicit TurnEngine(EventBus& bus, EngineMode mode = EngineMode::Authoritative);
	~TurnEngine();

	TurnEngine(const TurnEngine&)            = delete;
	TurnEngine& operator=(const TurnEngine&) = delete;

	//! Publish the initial state followed by the first turn. Not available in mirror mode.
	void start();

	//! Validate and apply a move without publishing anything.
	//! Checks are made in order: turn, bounds, occupancy, game over.
	//! \returns The rejection reason or empty if the move was applied.
	//! \note Throws LogicError for coordinates outside of the board.
	std::optional<MoveError> applyMove(const MoveRequested& request);

	EngineMode mode() const;
	Board board() const;
	Symbol currentPlayer() const;
	std::optional<Symbol> winner() const;
	bool isOver() const; //!< Game has a winner or the board is full.

private:
	void handleEvent(const MoveRequested& event);
	void handleEvent(const StateUpdated& event);

	std::optional<MoveError> applyMoveLocked(const MoveRequested& request);
	StateUpdated stateLocked() const;
	bool isOverLocked() const;

private:
	EventBus& m_bus;
	const EngineMode m_mode;

	mutable std::mutex m_mutex; //!< Guards the game state below.
	Board m_board;
	Symbol m_currentPlayer{Symbol::X};
	std::optional<Symbol> m_winner;

	std::vector<SubscriptionId> m_subscriptions;
};

} // namespace ttt
