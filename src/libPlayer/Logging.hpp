#pragma once

#include "Logger/Logger.hpp"

namespace ttt::player {

//! Returns the logger instance of the player library.
Logging::Logger Logger();

} // namespace ttt::player
