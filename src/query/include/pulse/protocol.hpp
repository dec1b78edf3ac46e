#pragma once

#include "pulse/statusRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pulse {

using Bytes = std::vector<std::uint8_t>; //!< One datagram.

inline constexpr std::uint8_t PROTOCOL_VERSION = 0x01; //!< First byte of every frame.
inline constexpr std::uint16_t DEFAULT_PORT    = 14006;

//! Requests are padded so that a request is never smaller than any response.
//! A spoofed source address therefore cannot be used to amplify traffic.
inline constexpr std::size_t MIN_REQUEST_BYTES = 1;
inline constexpr std::size_t REQUEST_BYTES     = 16;
inline constexpr std::size_t MAX_REQUEST_BYTES = 64;

//! [version:1][buildId:8][playersCount:2][playerCap:2][battleModeTag:1]
inline constexpr std::size_t RESPONSE_HEADER_BYTES = 1 + BUILD_ID_BYTES + 2 + 2 + 1;
//! Header plus the largest battle mode payload.
inline constexpr std::size_t MAX_RESPONSE_BYTES = RESPONSE_HEADER_BYTES + 1;

static_assert(REQUEST_BYTES >= MAX_RESPONSE_BYTES);
static_assert(REQUEST_BYTES <= MAX_REQUEST_BYTES);

//! Wire tags of the battle mode variants. Values are fixed for the lifetime of the protocol.
enum class BattleModeTag : std::uint8_t {
	GlobalPvP = 0,
	GlobalPvE = 1,
	PerPlayer = 2,
	Count //!< Used in deserialisation to reject unknown tags.
};

//! Decoded status query. Carries no payload besides the version.
struct Request {
	std::uint8_t version{PROTOCOL_VERSION};

	bool operator==(const Request&) const = default;
};

//! Status query frame, padded to REQUEST_BYTES.
Bytes encodeRequest();
//! Returns empty if the buffer is not a well-formed request of this protocol version.
std::optional<Request> decodeRequest(std::span<const std::uint8_t> buffer);

//! Response frame. All multi-byte integers in network byte order.
Bytes encodeResponse(const StatusRecord& record);
//! Returns empty on truncated frames, version mismatch, unknown tags, out of range values or trailing bytes.
std::optional<StatusRecord> decodeResponse(std::span<const std::uint8_t> buffer);

} // namespace pulse
