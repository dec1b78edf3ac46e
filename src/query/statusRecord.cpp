#include "pulse/statusRecord.hpp"

#include <algorithm>
#include <format>

namespace pulse {

BuildId buildIdFromString(std::string_view text) {
	BuildId buildId{};
	const auto count = std::min(text.size(), buildId.size());
	std::copy_n(text.begin(), count, buildId.begin());
	return buildId;
}

std::string toString(const BuildId& buildId) {
	std::string out;
	for (const auto byte: buildId) {
		if (byte == 0) {
			break;
		}
		if (byte >= 0x20 && byte < 0x7F) {
			out.push_back(static_cast<char>(byte));
		} else {
			out += std::format("\\x{:02x}", byte);
		}
	}
	return out.empty() ? std::string{"unknown"} : out;
}

static std::string toString(const GlobalPvP&) {
	return "GlobalPvP";
}
static std::string toString(const GlobalPvE&) {
	return "GlobalPvE";
}
static std::string toString(const PerPlayer& mode) {
	return std::format("PerPlayer(default={})", mode.defaultPvP ? "PvP" : "PvE");
}

std::string toString(const BattleMode& mode) {
	return std::visit([&](const auto& m) { return toString(m); }, mode);
}

std::string toString(const StatusRecord& record) {
	return std::format("build={}, players={}/{}, mode={}", toString(record.buildId), record.playersCount, record.playerCap,
	                   toString(record.battleMode));
}

} // namespace pulse
