#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pulse {

inline constexpr std::size_t BUILD_ID_BYTES = 8;

//! Opaque identifier of the running build. All zero means unknown.
using BuildId = std::array<std::uint8_t, BUILD_ID_BYTES>;

// Battle modes
struct GlobalPvP {
	bool operator==(const GlobalPvP&) const = default;
};
struct GlobalPvE {
	bool operator==(const GlobalPvE&) const = default;
};
//! Players may choose their own mode.
struct PerPlayer {
	bool defaultPvP{false}; //!< Mode a player gets without choosing one.

	bool operator==(const PerPlayer&) const = default;
};

using BattleMode = std::variant<GlobalPvP, GlobalPvE, PerPlayer>;

//! Snapshot of the server identity, load and mode served to status queries.
//! \note Player count is not validated against the cap. Servers may report overcap states.
struct StatusRecord {
	BuildId buildId{};
	std::uint16_t playersCount{0};
	std::uint16_t playerCap{0};
	BattleMode battleMode{GlobalPvP{}};

	bool operator==(const StatusRecord&) const = default;
};

//! Copy the first BUILD_ID_BYTES characters of the text. Shorter text is zero filled.
BuildId buildIdFromString(std::string_view text);

//! Printable characters of the build id up to the first zero byte. Other bytes are rendered as hex escapes.
std::string toString(const BuildId& buildId);
std::string toString(const BattleMode& mode);
std::string toString(const StatusRecord& record);

} // namespace pulse
