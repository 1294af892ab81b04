#include "Logging.hpp"

#include "core/logConfig.hpp"

#include <mutex>

namespace ttt::player {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { InitializeLogConfig(config, "Players"); });

	return Logging::Logger(config);
}

} // namespace ttt::player
