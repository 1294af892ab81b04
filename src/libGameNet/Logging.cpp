#include "Logging.hpp"

#include "core/logConfig.hpp"

#include <mutex>

namespace ttt::gameNet {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { InitializeLogConfig(config, "GameNet"); });

	return Logging::Logger(config);
}

} // namespace ttt::gameNet
