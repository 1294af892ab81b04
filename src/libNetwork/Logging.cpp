#include "Logging.hpp"

#include "core/logConfig.hpp"

#include <mutex>

namespace ttt::network {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { InitializeLogConfig(config, "Networking"); });

	return Logging::Logger(config);
}

} // namespace ttt::network
