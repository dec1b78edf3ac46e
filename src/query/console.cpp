#include "pulse/console.hpp"

#include "pulse/config.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <optional>
#include <sstream>
#include <string>

namespace pulse {

static std::optional<std::uint16_t> parseCount(const std::string& text) {
	std::uint16_t value  = 0;
	const auto* end      = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, value);
	if (ec != std::errc() || ptr != end) {
		return {};
	}
	return value;
}

//! Applies one update command to the record. Returns false if the command is not understood.
static bool applyCommand(const std::string& command, const std::string& argument, StatusRecord& record) {
	if (command == "players" || command == "cap") {
		const auto value = parseCount(argument);
		if (!value) {
			return false;
		}
		(command == "players" ? record.playersCount : record.playerCap) = *value;
		return true;
	}
	if (command == "mode") {
		const auto mode = battleModeFromString(argument);
		if (!mode) {
			return false;
		}
		record.battleMode = *mode;
		return true;
	}
	if (command == "build") {
		record.buildId = buildIdFromString(argument);
		return true;
	}
	return false;
}

bool runConsole(std::istream& input, std::ostream& output, StatusSource& source, const Metrics& metrics,
                const std::function<bool()>& keepRunning) {
	std::string line;
	while (std::getline(input, line)) {
		if (!keepRunning()) {
			return false;
		}

		std::istringstream words(line);
		std::string command;
		std::string argument;
		words >> command >> argument;

		if (command.empty()) {
			continue;
		}
		if (command == "quit" || command == "exit") {
			break;
		}
		if (command == "metrics") {
			output << toString(metrics.snapshot()) << "\n";
			continue;
		}

		auto record = source.latest();
		if (!applyCommand(command, argument, record)) {
			output << "Commands: players <n> | cap <n> | mode <pvp|pve|perPlayerPvP|perPlayerPvE> | build <id> | metrics | quit\n";
			continue;
		}
		source.publish(record);
		output << std::format("Published: {}\n", toString(record));
	}
	return true;
}

} // namespace pulse
