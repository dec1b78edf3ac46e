#include "pulse/protocol.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace pulse {

static void putU16(Bytes& out, std::uint16_t value) {
	out.push_back(static_cast<std::uint8_t>(value >> 8));
	out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

static std::uint16_t getU16(std::span<const std::uint8_t> in, std::size_t offset) {
	return static_cast<std::uint16_t>((static_cast<unsigned>(in[offset]) << 8) | in[offset + 1]);
}

static BattleModeTag toTag(const GlobalPvP&) {
	return BattleModeTag::GlobalPvP;
}
static BattleModeTag toTag(const GlobalPvE&) {
	return BattleModeTag::GlobalPvE;
}
static BattleModeTag toTag(const PerPlayer&) {
	return BattleModeTag::PerPlayer;
}

static void putBattleMode(Bytes& out, const BattleMode& mode) {
	out.push_back(static_cast<std::uint8_t>(std::visit([](const auto& m) { return toTag(m); }, mode)));
	if (const auto* perPlayer = std::get_if<PerPlayer>(&mode)) {
		out.push_back(static_cast<std::uint8_t>(perPlayer->defaultPvP ? 1u : 0u));
	}
}

//! Reads the battle mode starting at the tag byte. Returns the mode and the number of bytes consumed.
static std::optional<std::pair<BattleMode, std::size_t>> getBattleMode(std::span<const std::uint8_t> in) {
	if (in.empty() || in[0] >= static_cast<std::uint8_t>(BattleModeTag::Count)) {
		return {};
	}

	switch (static_cast<BattleModeTag>(in[0])) {
	case BattleModeTag::GlobalPvP:
		return std::pair<BattleMode, std::size_t>{GlobalPvP{}, 1};
	case BattleModeTag::GlobalPvE:
		return std::pair<BattleMode, std::size_t>{GlobalPvE{}, 1};
	case BattleModeTag::PerPlayer:
		// Boolean payload. Anything but 0 or 1 is out of range.
		if (in.size() < 2 || in[1] > 1u) {
			return {};
		}
		return std::pair<BattleMode, std::size_t>{PerPlayer{.defaultPvP = in[1] == 1u}, 2};
	case BattleModeTag::Count:
		break;
	}
	return {};
}

Bytes encodeRequest() {
	Bytes out(REQUEST_BYTES, 0u);
	out[0] = PROTOCOL_VERSION;
	return out;
}

std::optional<Request> decodeRequest(std::span<const std::uint8_t> buffer) {
	if (buffer.size() < MIN_REQUEST_BYTES || buffer.size() > MAX_REQUEST_BYTES) {
		return {};
	}
	if (buffer[0] != PROTOCOL_VERSION) {
		return {};
	}
	// Padding is reserved for extensions and not interpreted.
	return Request{.version = buffer[0]};
}

Bytes encodeResponse(const StatusRecord& record) {
	Bytes out;
	out.reserve(MAX_RESPONSE_BYTES);

	out.push_back(PROTOCOL_VERSION);
	out.insert(out.end(), record.buildId.begin(), record.buildId.end());
	putU16(out, record.playersCount);
	putU16(out, record.playerCap);
	putBattleMode(out, record.battleMode);

	return out;
}

std::optional<StatusRecord> decodeResponse(std::span<const std::uint8_t> buffer) {
	if (buffer.size() < RESPONSE_HEADER_BYTES || buffer.size() > MAX_RESPONSE_BYTES) {
		return {};
	}
	if (buffer[0] != PROTOCOL_VERSION) {
		return {};
	}

	StatusRecord record{};
	std::size_t offset = 1;

	std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(offset), BUILD_ID_BYTES, record.buildId.begin());
	offset += BUILD_ID_BYTES;

	record.playersCount = getU16(buffer, offset);
	offset += 2;
	record.playerCap = getU16(buffer, offset);
	offset += 2;

	const auto mode = getBattleMode(buffer.subspan(offset));
	if (!mode) {
		return {};
	}
	offset += mode->second;

	// Fixed size frame. Trailing bytes mean the frame is not ours.
	if (offset != buffer.size()) {
		return {};
	}

	record.battleMode = mode->first;
	return record;
}

} // namespace pulse
