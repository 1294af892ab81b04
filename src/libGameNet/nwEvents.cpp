#include "gameNet/nwEvents.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

namespace ttt::gameNet {

using network::Frame;

static std::string text(const Symbol symbol) {
	return std::string(toString(symbol));
}

static Frame toJson(const Grid& grid) {
	Frame rows = Frame::array();
	for (const auto& row : grid) {
		Frame cells = Frame::array();
		for (const auto& cell : row) {
			cells.push_back(cell ? Frame(text(*cell)) : Frame(nullptr));
		}
		rows.push_back(std::move(cells));
	}
	return rows;
}

static Frame toFrame(const NwAssignRole& e) {
	auto frame    = network::makeFrame(MSG_ASSIGN_ROLE);
	frame["role"] = text(e.role);
	return frame;
}
static Frame toFrame(const NwAssignRoleAck&) {
	return network::makeFrame(MSG_ASSIGN_ROLE_ACK);
}
static Frame toFrame(const MoveRequested& e) {
	auto frame      = network::makeFrame(MSG_MOVE_REQUESTED);
	frame["player"] = text(e.player);
	frame["row"]    = e.c.row;
	frame["col"]    = e.c.col;
	return frame;
}
static Frame toFrame(const StateUpdated& e) {
	auto frame              = network::makeFrame(MSG_STATE_UPDATED);
	frame["board"]          = toJson(e.board);
	frame["current_player"] = text(e.currentPlayer);
	frame["winner"]         = e.winner ? Frame(text(*e.winner)) : Frame(nullptr);
	return frame;
}
static Frame toFrame(const StartTurn& e) {
	auto frame      = network::makeFrame(MSG_START_TURN);
	frame["player"] = text(e.player);
	frame["board"]  = toJson(e.board);
	return frame;
}
static Frame toFrame(const InvalidMove& e) {
	auto frame       = network::makeFrame(MSG_INVALID_MOVE);
	frame["player"]  = text(e.request.player);
	frame["row"]     = e.request.c.row;
	frame["col"]     = e.request.c.col;
	frame["error"]   = std::string(toString(e.error));
	frame["message"] = e.message;
	return frame;
}

Frame toFrame(const NwEvent& event) {
	return std::visit([&](auto&& ev) { return toFrame(ev); }, event);
}


//! Frame holds exactly the type field and the given fields.
static bool hasExactFields(const Frame& frame, std::initializer_list<const char*> fields) {
	if (frame.size() != fields.size() + 1) {
		return false;
	}
	return std::ranges::all_of(fields, [&frame](const char* field) { return frame.contains(field); });
}

static std::optional<Symbol> readSymbol(const Frame& value) {
	if (!value.is_string()) {
		return std::nullopt;
	}
	return symbolFromString(value.get<std::string>());
}

static std::optional<int> readIndex(const Frame& value) {
	if (!value.is_number_integer()) {
		return std::nullopt;
	}
	// Range is checked by the engine. Only reject what does not fit an int.
	const auto number = value.get<long long>();
	if (number < -BOARD_SIZE * 1000 || number > BOARD_SIZE * 1000) {
		return std::nullopt;
	}
	return static_cast<int>(number);
}

//! Symbol or null.
static std::optional<Cell> readCell(const Frame& value) {
	if (value.is_null()) {
		return Cell{};
	}
	const auto symbol = readSymbol(value);
	if (!symbol) {
		return std::nullopt;
	}
	return Cell{*symbol};
}

static std::optional<Grid> readGrid(const Frame& value) {
	if (!value.is_array() || value.size() != BOARD_SIZE) {
		return std::nullopt;
	}

	Grid grid{};
	for (std::size_t row = 0; row < BOARD_SIZE; ++row) {
		const auto& cells = value[row];
		if (!cells.is_array() || cells.size() != BOARD_SIZE) {
			return std::nullopt;
		}
		for (std::size_t col = 0; col < BOARD_SIZE; ++col) {
			const auto cell = readCell(cells[col]);
			if (!cell) {
				return std::nullopt;
			}
			grid[row][col] = *cell;
		}
	}
	return grid;
}

static std::optional<NwEvent> fromAssignRole(const Frame& frame) {
	if (!hasExactFields(frame, {"role"})) {
		return {};
	}
	const auto role = readSymbol(frame["role"]);
	if (!role) {
		return {};
	}
	return NwAssignRole{*role};
}

static std::optional<MoveRequested> readMove(const Frame& frame) {
	const auto player = readSymbol(frame["player"]);
	const auto row    = readIndex(frame["row"]);
	const auto col    = readIndex(frame["col"]);
	if (!player || !row || !col) {
		return {};
	}
	return MoveRequested{*player, Coord{*row, *col}};
}

static std::optional<NwEvent> fromMoveRequested(const Frame& frame) {
	if (!hasExactFields(frame, {"player", "row", "col"})) {
		return {};
	}
	const auto move = readMove(frame);
	if (!move) {
		return {};
	}
	return *move;
}

static std::optional<NwEvent> fromStateUpdated(const Frame& frame) {
	if (!hasExactFields(frame, {"board", "current_player", "winner"})) {
		return {};
	}
	const auto board   = readGrid(frame["board"]);
	const auto current = readSymbol(frame["current_player"]);
	const auto winner  = readCell(frame["winner"]);
	if (!board || !current || !winner) {
		return {};
	}
	return StateUpdated{*board, *current, *winner};
}

static std::optional<NwEvent> fromStartTurn(const Frame& frame) {
	if (!hasExactFields(frame, {"player", "board"})) {
		return {};
	}
	const auto player = readSymbol(frame["player"]);
	const auto board  = readGrid(frame["board"]);
	if (!player || !board) {
		return {};
	}
	return StartTurn{*player, *board};
}

static std::optional<NwEvent> fromInvalidMove(const Frame& frame) {
	if (!hasExactFields(frame, {"player", "row", "col", "error", "message"})) {
		return {};
	}
	const auto move  = readMove(frame);
	const auto error = frame["error"].is_string() ? moveErrorFromString(frame["error"].get<std::string>()) : std::nullopt;
	if (!move || !error || !frame["message"].is_string()) {
		return {};
	}
	return InvalidMove{*move, *error, frame["message"].get<std::string>()};
}

std::optional<NwEvent> fromFrame(const Frame& frame) {
	if (!network::isValidFrame(frame)) {
		return {};
	}

	const auto type = network::frameType(frame);
	if (type == MSG_ASSIGN_ROLE) {
		return fromAssignRole(frame);
	}
	if (type == MSG_ASSIGN_ROLE_ACK) {
		if (!hasExactFields(frame, {})) {
			return {};
		}
		return NwAssignRoleAck{};
	}
	if (type == MSG_MOVE_REQUESTED) {
		return fromMoveRequested(frame);
	}
	if (type == MSG_STATE_UPDATED) {
		return fromStateUpdated(frame);
	}
	if (type == MSG_START_TURN) {
		return fromStartTurn(frame);
	}
	if (type == MSG_INVALID_MOVE) {
		return fromInvalidMove(frame);
	}

	// Unknown
	return {};
}

} // namespace ttt::gameNet
