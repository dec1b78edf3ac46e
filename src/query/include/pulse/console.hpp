#pragma once

#include "pulse/metrics.hpp"
#include "pulse/statusSource.hpp"

#include <functional>
#include <istream>
#include <ostream>

namespace pulse {

//! Operator console of the status server. Reads one command per line:
//! players <n> | cap <n> | mode <pvp|pve|perPlayerPvP|perPlayerPvE> | build <id> | metrics | quit | exit
//! Each accepted update publishes a new record built from the latest one.
//!
//! Returns when the input ends, on quit or exit, or when keepRunning returns false for a read line.
//! Returns false only in the last case.
bool runConsole(std::istream& input, std::ostream& output, StatusSource& source, const Metrics& metrics,
                const std::function<bool()>& keepRunning);

} // namespace pulse
