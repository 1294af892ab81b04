#pragma once

#include "Logger/Logger.hpp"

namespace ttt::gameNet {

//! Returns the logger instance of the game networking library.
Logging::Logger Logger();

} // namespace ttt::gameNet
