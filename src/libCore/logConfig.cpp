#include "core/logConfig.hpp"

#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace ttt {

Logging::LogLevel configuredLogLevel() {
	const char* value = std::getenv(LOG_LEVEL_ENV);
	if (value == nullptr) {
		return Logging::LogLevel::Any;
	}

	const std::string_view level{value};
	if (level == "debug") {
		return Logging::LogLevel::Debug;
	}
	if (level == "info") {
		return Logging::LogLevel::Info;
	}
	if (level == "warning") {
		return Logging::LogLevel::Warning;
	}
	if (level == "error") {
		return Logging::LogLevel::Error;
	}
	return Logging::LogLevel::Any;
}

void InitializeLogConfig(Logging::LogConfig& config, const std::string_view component) {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(configuredLogLevel());

	// Get and create default logging dir
	const auto logPath = Logging::GetDefaultLogDir(std::format("TicTacToe/{}", component));

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nApplication will not log to file.\n", logPath.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

} // namespace ttt
