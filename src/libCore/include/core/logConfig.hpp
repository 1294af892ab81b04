#pragma once

#include "Logger/LogConfig.hpp"

#include <string_view>

namespace ttt {

//! Environment variable holding the minimum log level: debug, info, warning or error.
inline constexpr const char* LOG_LEVEL_ENV = "TTT_LOG_LEVEL";

//! Minimum log level configured through LOG_LEVEL_ENV. Unset or unknown values log everything.
Logging::LogLevel configuredLogLevel();

//! Enable logging to "TicTacToe/<component>/log.txt" in the default log directory + console (for debug builds).
void InitializeLogConfig(Logging::LogConfig& config, std::string_view component);

} // namespace ttt
