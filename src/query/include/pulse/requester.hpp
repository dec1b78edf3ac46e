#pragma once

#include "pulse/protocol.hpp"
#include "pulse/statusRecord.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace pulse {

enum class QueryError {
	Timeout,          //!< No response from the server within the timeout.
	MalformedMessage, //!< A response arrived but could not be decoded.
	TransportFatal    //!< Address could not be resolved or the socket failed.
};

std::string_view toString(QueryError error);

struct StatusReply {
	StatusRecord record;
	std::chrono::nanoseconds roundTrip; //!< From sending the request to receiving the response.
};

using QueryResult = std::variant<StatusReply, QueryError>;

//! Client side of the status query.
//! \note Performs no retries. Retry and backoff are up to the caller.
//!       status() may be called concurrently; every call uses its own socket.
class Requester {
public:
	//! Resolves the server address once. Resolution failures are reported by status().
	explicit Requester(std::string host, std::uint16_t port = DEFAULT_PORT);
	~Requester();

	Requester(const Requester&)            = delete;
	Requester& operator=(const Requester&) = delete;
	Requester(Requester&&)                 = delete;
	Requester& operator=(Requester&&)      = delete;

	//! Send one request and wait up to timeout for the response.
	QueryResult status(std::chrono::milliseconds timeout) const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace pulse
