#include "options.hpp"

#include <charconv>
#include <format>

namespace ttt::app {

static PlayerKind parsePlayerKind(const std::string_view option, const std::string_view value) {
	if (value == "human") {
		return PlayerKind::Human;
	}
	if (value == "easy-ai") {
		return PlayerKind::EasyAi;
	}
	if (value == "hard-ai") {
		return PlayerKind::HardAi;
	}
	throw OptionsError(std::format("Invalid value '{}' for {}. Expected human, easy-ai or hard-ai.", value, option));
}

static unsigned long parseNumber(const std::string_view option, const std::string_view value, const unsigned long max) {
	unsigned long number = 0;
	const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
	if (ec != std::errc() || end != value.data() + value.size() || number > max) {
		throw OptionsError(std::format("Invalid value '{}' for {}. Expected a number up to {}.", value, option, max));
	}
	return number;
}

Options parseOptions(const std::vector<std::string_view>& args) {
	Options options;
	bool roleGiven = false;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto option = args[i];
		if (option == "--help" || option == "-h") {
			options.showHelp = true;
			continue;
		}

		if (i + 1 >= args.size()) {
			throw OptionsError(option.starts_with("--") ? std::format("Missing value for {}.", option) : std::format("Unexpected argument '{}'.", option));
		}
		const auto value = args[++i];

		if (option == "--mode") {
			if (value == "local") {
				options.mode = Mode::Local;
			} else if (value == "network") {
				options.mode = Mode::Network;
			} else {
				throw OptionsError(std::format("Invalid mode '{}'. Expected local or network.", value));
			}
		} else if (option == "--role") {
			if (value == "host") {
				options.role = Role::Host;
			} else if (value == "client") {
				options.role = Role::Client;
			} else {
				throw OptionsError(std::format("Invalid role '{}'. Expected host or client.", value));
			}
			roleGiven = true;
		} else if (option == "--player-x") {
			options.playerX = parsePlayerKind(option, value);
		} else if (option == "--player-o") {
			options.playerO = parsePlayerKind(option, value);
		} else if (option == "--player") {
			options.player = parsePlayerKind(option, value);
		} else if (option == "--host") {
			options.host = std::string(value);
		} else if (option == "--port") {
			options.port = static_cast<std::uint16_t>(parseNumber(option, value, 65535));
		} else if (option == "--timeout") {
			const auto seconds = parseNumber(option, value, 24 * 60 * 60);
			if (seconds == 0) {
				throw OptionsError("Timeout must be at least one second.");
			}
			options.timeout = std::chrono::seconds(seconds);
		} else {
			throw OptionsError(std::format("Unknown option '{}'.", option));
		}
	}

	if (options.mode == Mode::Network && !roleGiven && !options.showHelp) {
		throw OptionsError("Network mode requires --role host or --role client.");
	}
	return options;
}

std::string usage(const std::string_view program) {
	return std::format("Usage:\n"
	                   "  {0} --mode local   [--player-x KIND] [--player-o KIND]\n"
	                   "  {0} --mode network --role host   [--port N] [--timeout SECONDS] [--player KIND]\n"
	                   "  {0} --mode network --role client [--host H] [--port N] [--timeout SECONDS] [--player KIND]\n"
	                   "\n"
	                   "KIND is one of human, easy-ai, hard-ai (default human).\n"
	                   "Defaults: --host 127.0.0.1 --port {1}\n"
	                   "Enter moves as 'row col' with values from 0 to 2. Type 'quit' to leave.\n",
	                   program, network::DEFAULT_PORT);
}

} // namespace ttt::app
