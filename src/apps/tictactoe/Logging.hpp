#pragma once

#include "Logger/Logger.hpp"

namespace ttt::app {

//! Returns the logger instance of the application.
Logging::Logger Logger();

} // namespace ttt::app
