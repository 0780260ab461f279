#pragma once

#include "Logger/Logger.hpp"

namespace scramble::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace scramble::app
