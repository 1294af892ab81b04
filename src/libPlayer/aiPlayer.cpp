#include "player/aiPlayer.hpp"

#include "Logging.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <vector>

namespace ttt {

namespace {

//! Score of a position from the point of view of `me`. Faster wins and slower losses score better.
int minimax(Board& board, const Symbol toMove, const Symbol me, const int depth) {
	if (const auto winner = board.winner()) {
		return *winner == me ? 10 - depth : depth - 10;
	}
	if (board.isFull()) {
		return 0;
	}

	const bool maximizing = toMove == me;
	int best              = maximizing ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
	for (const auto c : board.freeCells()) {
		board.setAt(c, toMove);
		const int score = minimax(board, opponent(toMove), me, depth + 1);
		board.clearAt(c);

		best = maximizing ? std::max(best, score) : std::min(best, score);
	}
	return best;
}

} // namespace

//! Deferred search for one turn. Delivered on the bus worker.
struct AiPlayer::SearchRequested {
	Symbol player;
	Grid board;
};

std::string_view toString(const AiLevel level) {
	return level == AiLevel::Easy ? "easy" : "hard";
}

AiPlayer::AiPlayer(EventBus& bus, const Symbol symbol, const AiLevel level, const std::uint32_t seed)
        : m_bus(bus), m_symbol(symbol), m_level(level), m_rng(seed) {
	m_subscriptions.push_back(m_bus.subscribe<StartTurn>([this](const StartTurn& event) {
		if (event.player == m_symbol) {
			onStartTurn(event);
		}
	}));
	m_subscriptions.push_back(m_bus.subscribe<SearchRequested>([this](const SearchRequested& event) {
		if (event.player == m_symbol) {
			play(event.board);
		}
	}));
}

AiPlayer::~AiPlayer() {
	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

Symbol AiPlayer::symbol() const {
	return m_symbol;
}

AiLevel AiPlayer::level() const {
	return m_level;
}

void AiPlayer::onStartTurn(const StartTurn& event) {
	m_bus.publishAsync(SearchRequested{m_symbol, event.board});
}

void AiPlayer::play(const Grid& grid) {
	const auto move = chooseMove(Board(grid));
	if (!move) {
		throw LogicError(std::format("AI {} was asked to move on a full board.", toString(m_symbol)));
	}

	player::Logger().Log(Logging::LogLevel::Debug,
	                     std::format("[AiPlayer] {} ({}) plays ({}, {}).", toString(m_symbol), toString(m_level), move->row, move->col));
	m_bus.publish(MoveRequested{m_symbol, *move});
}

std::optional<Coord> AiPlayer::chooseMove(const Board& board) {
	return m_level == AiLevel::Easy ? randomMove(board) : bestMove(board);
}

std::optional<Coord> AiPlayer::randomMove(const Board& board) {
	const auto cells = board.freeCells();
	if (cells.empty()) {
		return std::nullopt;
	}

	std::lock_guard<std::mutex> lock(m_rngMutex);
	std::uniform_int_distribution<std::size_t> pick(0, cells.size() - 1);
	return cells[pick(m_rng)];
}

std::optional<Coord> AiPlayer::bestMove(const Board& board) {
	if (board.winner() || board.isFull()) {
		return std::nullopt;
	}

	Board work = board;
	int bestScore = std::numeric_limits<int>::min();
	std::vector<Coord> bestMoves;
	for (const auto c : work.freeCells()) {
		work.setAt(c, m_symbol);
		const int score = minimax(work, opponent(m_symbol), m_symbol, 1);
		work.clearAt(c);

		if (score > bestScore) {
			bestScore = score;
			bestMoves = {c};
		} else if (score == bestScore) {
			bestMoves.push_back(c);
		}
	}

	// Equally good moves are picked at random to vary games.
	std::lock_guard<std::mutex> lock(m_rngMutex);
	std::uniform_int_distribution<std::size_t> pick(0, bestMoves.size() - 1);
	return bestMoves[pick(m_rng)];
}

} // namespace ttt
