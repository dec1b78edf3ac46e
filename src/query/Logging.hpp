#pragma once

#include "Logger/Logger.hpp"

namespace pulse {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace pulse
