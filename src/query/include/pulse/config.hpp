#pragma once

#include "pulse/responder.hpp"
#include "pulse/statusRecord.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace pulse {

//! Settings of the status server application.
struct ServerConfig {
	ResponderConfig responder;
	StatusRecord initialStatus{.buildId = {}, .playersCount = 0, .playerCap = 100, .battleMode = GlobalPvE{}};
};

//! Parse a JSON configuration. Missing keys keep their defaults.
//! Returns empty if the text is not JSON, a key has the wrong type or a value is out of range.
//!
//! Keys: address, port, workerThreads, maxInFlight, buildId, playersCount, playerCap,
//!       battleMode ("pvp", "pve", "perPlayerPvP", "perPlayerPvE").
std::optional<ServerConfig> parseConfig(std::string_view json);

//! Read and parse a configuration file. Returns empty if the file cannot be read or parsed.
std::optional<ServerConfig> loadConfig(const std::filesystem::path& path);

//! Battle mode from its configuration name. Returns empty for unknown names.
std::optional<BattleMode> battleModeFromString(std::string_view name);

} // namespace pulse
