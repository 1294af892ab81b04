#pragma once

#include "Logger/Logger.hpp"

namespace ttt {

//! Returns the logger instance of the core library.
Logging::Logger Logger();

} // namespace ttt
