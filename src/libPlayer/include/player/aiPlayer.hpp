#pragma once

#include "player/player.hpp"

#include "core/board.hpp"
#include "core/eventBus.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace ttt {

enum class AiLevel {
	Easy, //!< Uniformly random free cell.
	Hard, //!< Full minimax search. Never loses.
};

std::string_view toString(AiLevel level);

//! Computer opponent. Its StartTurn only queues the search. The search and the resulting MoveRequested
//! run on the bus worker, so neither the engine nor a channel reader waits for the AI.
class AiPlayer : public IPlayer {
public:
	AiPlayer(EventBus& bus, Symbol symbol, AiLevel level, std::uint32_t seed = std::random_device{}());
	~AiPlayer() override;

	AiPlayer(const AiPlayer&)            = delete;
	AiPlayer& operator=(const AiPlayer&) = delete;

	Symbol symbol() const override;
	AiLevel level() const;
	void onStartTurn(const StartTurn& event) override;

	//! Pick a move for this player's symbol. Empty if the board has no free cell.
	std::optional<Coord> chooseMove(const Board& board);

private:
	struct SearchRequested;

	void play(const Grid& grid);
	std::optional<Coord> randomMove(const Board& board);
	std::optional<Coord> bestMove(const Board& board);

private:
	EventBus& m_bus;
	const Symbol m_symbol;
	const AiLevel m_level;

	std::mutex m_rngMutex;
	std::mt19937 m_rng;

	std::vector<SubscriptionId> m_subscriptions;
};

} // namespace ttt
