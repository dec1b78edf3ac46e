#include "pulse/config.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace pulse {

using nlohmann::json;

static constexpr std::size_t MAX_WORKER_THREADS = 64;

//! Reads an unsigned key into out if present. Returns false on wrong type or if the value exceeds max.
static bool readUnsigned(const json& root, const char* key, std::uint64_t max, std::uint64_t& out) {
	const auto it = root.find(key);
	if (it == root.end()) {
		return true;
	}
	if (!it->is_number_unsigned() || it->get<std::uint64_t>() > max) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] '{}' must be an unsigned integer not larger than {}.", key, max));
		return false;
	}
	out = it->get<std::uint64_t>();
	return true;
}

static bool readString(const json& root, const char* key, std::optional<std::string>& out) {
	const auto it = root.find(key);
	if (it == root.end()) {
		return true;
	}
	if (!it->is_string()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] '{}' must be a string.", key));
		return false;
	}
	out = it->get<std::string>();
	return true;
}

std::optional<BattleMode> battleModeFromString(std::string_view name) {
	if (name == "pvp") {
		return GlobalPvP{};
	}
	if (name == "pve") {
		return GlobalPvE{};
	}
	if (name == "perPlayerPvP") {
		return PerPlayer{.defaultPvP = true};
	}
	if (name == "perPlayerPvE") {
		return PerPlayer{.defaultPvP = false};
	}
	return {};
}

std::optional<ServerConfig> parseConfig(std::string_view text) {
	const auto root = json::parse(text.begin(), text.end(), nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		Logger().Log(Logging::LogLevel::Error, "[Config] Configuration is not a JSON object.");
		return {};
	}

	ServerConfig config{};
	auto& responder = config.responder;
	auto& status    = config.initialStatus;

	std::optional<std::string> address;
	std::optional<std::string> buildId;
	std::optional<std::string> battleMode;
	if (!readString(root, "address", address) || !readString(root, "buildId", buildId) || !readString(root, "battleMode", battleMode)) {
		return {};
	}

	std::uint64_t port          = responder.port;
	std::uint64_t workerThreads = responder.workerThreads;
	std::uint64_t maxInFlight   = responder.maxInFlight;
	std::uint64_t playersCount  = status.playersCount;
	std::uint64_t playerCap     = status.playerCap;

	constexpr auto u16Max = std::numeric_limits<std::uint16_t>::max();
	if (!readUnsigned(root, "port", u16Max, port) || !readUnsigned(root, "workerThreads", MAX_WORKER_THREADS, workerThreads) ||
	    !readUnsigned(root, "maxInFlight", std::numeric_limits<std::uint32_t>::max(), maxInFlight) ||
	    !readUnsigned(root, "playersCount", u16Max, playersCount) || !readUnsigned(root, "playerCap", u16Max, playerCap)) {
		return {};
	}
	if (workerThreads == 0 || maxInFlight == 0) {
		Logger().Log(Logging::LogLevel::Error, "[Config] 'workerThreads' and 'maxInFlight' must be at least 1.");
		return {};
	}

	if (address) {
		responder.address = *address;
	}
	if (buildId) {
		status.buildId = buildIdFromString(*buildId);
	}
	if (battleMode) {
		const auto mode = battleModeFromString(*battleMode);
		if (!mode) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Config] Unknown battle mode '{}'.", *battleMode));
			return {};
		}
		status.battleMode = *mode;
	}

	responder.port          = static_cast<std::uint16_t>(port);
	responder.workerThreads = static_cast<std::size_t>(workerThreads);
	responder.maxInFlight   = static_cast<std::size_t>(maxInFlight);
	status.playersCount     = static_cast<std::uint16_t>(playersCount);
	status.playerCap        = static_cast<std::uint16_t>(playerCap);

	return config;
}

std::optional<ServerConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] Could not open '{}'.", path.string()));
		return {};
	}

	std::stringstream content;
	content << file.rdbuf();

	auto config = parseConfig(content.str());
	if (config) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Config] Loaded '{}'.", path.string()));
	}
	return config;
}

} // namespace pulse
