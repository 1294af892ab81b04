#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ttt::app {

enum class Mode { Local, Network };
enum class Role { Host, Client };
enum class PlayerKind { Human, EasyAi, HardAi };

struct Options {
	Mode mode{Mode::Local};
	PlayerKind playerX{PlayerKind::Human}; //!< Local mode.
	PlayerKind playerO{PlayerKind::Human}; //!< Local mode.

	Role role{Role::Host};                //!< Network mode.
	PlayerKind player{PlayerKind::Human}; //!< Network mode. Participant at this side.
	std::string host{"127.0.0.1"};
	std::uint16_t port{network::DEFAULT_PORT};
	std::optional<std::chrono::seconds> timeout; //!< Accept or connect timeout. Waits forever if empty.

	bool showHelp{false};
};

//! Invalid command line.
class OptionsError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Parse the arguments following the program name.
//! \note Throws OptionsError for unknown options, missing values and values out of range.
Options parseOptions(const std::vector<std::string_view>& args);

std::string usage(std::string_view program);

} // namespace ttt::app
