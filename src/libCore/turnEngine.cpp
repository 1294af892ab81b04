#include "core/turnEngine.hpp"

#include "Logging.hpp"

#include <format>

namespace ttt {

TurnEngine::TurnEngine(EventBus& bus, const EngineMode mode) : m_bus(bus), m_mode(mode) {
	if (m_mode == EngineMode::Authoritative) {
		m_subscriptions.push_back(m_bus.subscribe<MoveRequested>([this](const MoveRequested& event) { handleEvent(event); }));
	} else {
		m_subscriptions.push_back(m_bus.subscribe<StateUpdated>([this](const StateUpdated& event) { handleEvent(event); }));
	}
}

TurnEngine::~TurnEngine() {
	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

void TurnEngine::start() {
	if (m_mode == EngineMode::Mirror) {
		throw LogicError("A mirror engine can not start a game.");
	}

	StateUpdated state;
	bool over = false;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		state = stateLocked();
		over  = isOverLocked();
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[TurnEngine] Game started. {} begins.", toString(state.currentPlayer)));
	m_bus.publish(state);
	if (!over) {
		m_bus.publish(StartTurn{state.currentPlayer, state.board});
	}
}

std::optional<MoveError> TurnEngine::applyMove(const MoveRequested& request) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return applyMoveLocked(request);
}

std::optional<MoveError> TurnEngine::applyMoveLocked(const MoveRequested& request) {
	if (request.player != m_currentPlayer) {
		return MoveError::NotYourTurn;
	}
	if (!isInside(request.c)) {
		throw LogicError(std::format("Move ({}, {}) is outside of the board.", request.c.row, request.c.col));
	}
	if (!m_board.isFree(request.c)) {
		return MoveError::CellOccupied;
	}
	if (isOverLocked()) {
		return MoveError::GameOver;
	}

	m_board.setAt(request.c, request.player);
	m_winner        = m_board.winner();
	m_currentPlayer = opponent(m_currentPlayer);
	return std::nullopt;
}

void TurnEngine::handleEvent(const MoveRequested& event) {
	std::optional<MoveError> error;
	StateUpdated state;
	bool over = false;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		error = applyMoveLocked(event);
		state = stateLocked();
		over  = isOverLocked();
	}

	auto logger = Logger();
	if (error) {
		logger.Log(Logging::LogLevel::Info, std::format("[TurnEngine] Rejected move of {} at ({}, {}): {}", toString(event.player), event.c.row,
		                                                event.c.col, toString(*error)));

		m_bus.publish(InvalidMove{event, *error, std::string(describe(*error))});
		if (!over) {
			m_bus.publish(StartTurn{state.currentPlayer, state.board});
		}
		return;
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[TurnEngine] {} placed at ({}, {}).", toString(event.player), event.c.row, event.c.col));
	m_bus.publish(state);
	if (over) {
		logger.Log(Logging::LogLevel::Info, state.winner ? std::format("[TurnEngine] Game over. {} wins.", toString(*state.winner))
		                                                 : std::string("[TurnEngine] Game over. Draw."));
		return;
	}
	m_bus.publish(StartTurn{state.currentPlayer, state.board});
}

void TurnEngine::handleEvent(const StateUpdated& event) {
	std::lock_guard<std::mutex> lock(m_mutex);

	m_board         = Board(event.board);
	m_currentPlayer = event.currentPlayer;
	m_winner        = event.winner;
}

StateUpdated TurnEngine::stateLocked() const {
	return StateUpdated{m_board.grid(), m_currentPlayer, m_winner};
}

bool TurnEngine::isOverLocked() const {
	return m_winner.has_value() || m_board.isFull();
}

EngineMode TurnEngine::mode() const {
	return m_mode;
}

Board TurnEngine::board() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_board;
}

Symbol TurnEngine::currentPlayer() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_currentPlayer;
}

std::optional<Symbol> TurnEngine::winner() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_winner;
}

bool TurnEngine::isOver() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return isOverLocked();
}

} // namespace ttt
