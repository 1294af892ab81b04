#include "consoleUi.hpp"

#include <format>
#include <sstream>

namespace ttt::app {

ConsoleUi::ConsoleUi(EventBus& bus, std::istream& in, std::ostream& out) : m_bus(bus), m_in(in), m_out(out) {
	m_subscriptions.push_back(m_bus.subscribe<StateUpdated>([this](const StateUpdated& event) { onStateUpdated(event); }));
	m_subscriptions.push_back(m_bus.subscribe<EnableInput>([this](const EnableInput& event) { onEnableInput(event); }));
	m_subscriptions.push_back(m_bus.subscribe<InputError>([this](const InputError& event) { onInputError(event); }));
	m_subscriptions.push_back(m_bus.subscribe<ConnectionLost>([this](const ConnectionLost& event) { onConnectionLost(event); }));
}

ConsoleUi::~ConsoleUi() {
	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

void ConsoleUi::addHumanSymbol(const Symbol symbol) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_humanSymbols.insert(symbol);
}

void ConsoleUi::print(const std::string& message) {
	std::lock_guard<std::mutex> lock(m_outputMutex);
	m_out << message << '\n' << std::flush;
}

void ConsoleUi::abort(const std::string& reason) {
	print(std::format("Error: {}", reason));
	finish(SessionEnd::Failed);
}

SessionEnd ConsoleUi::run() {
	while (true) {
		Symbol player{};
		{
			std::unique_lock<std::mutex> lock(m_mutex);
			m_condition.wait(lock, [this] { return m_inputFor.has_value() || m_end.has_value(); });
			if (m_end) {
				return *m_end;
			}
			player = *m_inputFor;
			m_inputFor.reset();
		}

		{
			std::lock_guard<std::mutex> lock(m_outputMutex);
			m_out << std::format("{} > ", toString(player)) << std::flush;
		}

		std::string line;
		if (!std::getline(m_in, line)) {
			finish(SessionEnd::InputClosed);
			continue;
		}
		if (line == "quit" || line == "exit") {
			finish(SessionEnd::Quit);
			continue;
		}

		const auto move = parseMove(line);
		if (!move) {
			print("Enter row and column as two numbers from 0 to 2, e.g. '1 2'.");
			std::lock_guard<std::mutex> lock(m_mutex);
			if (!m_end) {
				m_inputFor = player;
			}
			continue;
		}

		// Handlers may run on this thread. No lock is held here.
		try {
			m_bus.publish(MoveRequested{player, *move});
		} catch (const NetworkError& ex) {
			print(std::format("Connection lost: {}", ex.what()));
			finish(SessionEnd::ConnectionLost);
		}
	}
}

void ConsoleUi::onStateUpdated(const StateUpdated& event) {
	const Board board(event.board);

	std::string text = renderBoard(event.board);
	if (event.winner) {
		text += std::format("{} wins!\n", toString(*event.winner));
	} else if (board.isFull()) {
		text += "Draw.\n";
	} else {
		text += std::format("{} to move.\n", toString(event.currentPlayer));
	}
	print(text);

	if (event.winner || board.isFull()) {
		finish(SessionEnd::Finished);
	}
}

void ConsoleUi::onEnableInput(const EnableInput& event) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_humanSymbols.contains(event.player) || m_end) {
			return;
		}
		m_inputFor = event.player;
	}
	m_condition.notify_all();
}

void ConsoleUi::onInputError(const InputError& event) {
	print(std::format("Invalid move for {}: {}", toString(event.player), event.message));
}

void ConsoleUi::onConnectionLost(const ConnectionLost& event) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_end) {
			return;
		}
	}
	print(std::format("Connection lost: {}", event.reason));
	finish(SessionEnd::ConnectionLost);
}

void ConsoleUi::finish(const SessionEnd end) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_end) {
			return;
		}
		m_end = end;
		m_inputFor.reset();
	}
	m_condition.notify_all();
}

std::string ConsoleUi::renderBoard(const Grid& board) {
	std::string text = "    0   1   2\n";
	for (int row = 0; row < BOARD_SIZE; ++row) {
		text += std::format("{}  ", row);
		for (int col = 0; col < BOARD_SIZE; ++col) {
			const auto& cell = board[row][col];
			text += std::format(" {} ", cell ? toString(*cell) : std::string_view(" "));
			if (col + 1 < BOARD_SIZE) {
				text += '|';
			}
		}
		text += '\n';
		if (row + 1 < BOARD_SIZE) {
			text += "   ---+---+---\n";
		}
	}
	return text;
}

std::optional<Coord> ConsoleUi::parseMove(const std::string& line) {
	std::istringstream stream(line);
	Coord c{};
	std::string rest;
	if (!(stream >> c.row >> c.col) || (stream >> rest) || !isInside(c)) {
		return std::nullopt;
	}
	return c;
}

} // namespace ttt::app
