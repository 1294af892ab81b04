#pragma once

#include "core/board.hpp"
#include "core/eventBus.hpp"
#include "core/gameEvent.hpp"

#include <condition_variable>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace ttt::app {

enum class SessionEnd {
	Finished,       //!< Somebody won or the board is full.
	Quit,           //!< The user typed quit.
	InputClosed,    //!< End of input stream.
	ConnectionLost, //!< Peer disconnected.
	Failed,         //!< An asynchronous participant failed.
};

//! Terminal front end. Renders every StateUpdated and reads moves for the human symbols.
//! Bus handlers only record what happened. The thread in run() does all the reading.
class ConsoleUi {
public:
	ConsoleUi(EventBus& bus, std::istream& in, std::ostream& out);
	~ConsoleUi();

	ConsoleUi(const ConsoleUi&)            = delete;
	ConsoleUi& operator=(const ConsoleUi&) = delete;

	//! Read moves for this symbol when input is enabled for it.
	void addHumanSymbol(Symbol symbol);

	//! Print a line of information.
	void print(const std::string& message);

	//! End run() with SessionEnd::Failed.
	void abort(const std::string& reason);

	//! Blocks until the session ended.
	SessionEnd run();

	static std::string renderBoard(const Grid& board);
	//! Parses "row col". Empty for anything else, including values outside of the board.
	static std::optional<Coord> parseMove(const std::string& line);

private:
	void onStateUpdated(const StateUpdated& event);
	void onEnableInput(const EnableInput& event);
	void onInputError(const InputError& event);
	void onConnectionLost(const ConnectionLost& event);
	void finish(SessionEnd end);

private:
	EventBus& m_bus;
	std::istream& m_in;
	std::ostream& m_out;
	std::mutex m_outputMutex;

	std::mutex m_mutex; //!< Guards the state below.
	std::condition_variable m_condition;
	std::set<Symbol> m_humanSymbols;
	std::optional<Symbol> m_inputFor;
	std::optional<SessionEnd> m_end;

	std::vector<SubscriptionId> m_subscriptions;
};

} // namespace ttt::app
