#include "pulse/requester.hpp"

#include "Logging.hpp"

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include <array>
#include <format>
#include <functional>
#include <optional>
#include <span>
#include <utility>

namespace pulse {

using Clock = std::chrono::steady_clock;

std::string_view toString(QueryError error) {
	switch (error) {
	case QueryError::Timeout:
		return "timeout";
	case QueryError::MalformedMessage:
		return "malformed message";
	case QueryError::TransportFatal:
		return "transport failure";
	}
	return "unknown";
}

class Requester::Implementation {
public:
	Implementation(std::string host, std::uint16_t port);

	QueryResult status(std::chrono::milliseconds timeout) const;

private:
	const std::string m_host;
	const std::uint16_t m_port;
	std::optional<asio::ip::udp::endpoint> m_server; //!< Empty if the host could not be resolved.
};

Requester::Implementation::Implementation(std::string host, std::uint16_t port) : m_host(std::move(host)), m_port(port) {
	asio::io_context ioContext;
	asio::ip::udp::resolver resolver(ioContext);

	asio::error_code ec;
	const auto endpoints = resolver.resolve(m_host, std::to_string(m_port), ec);
	if (ec || endpoints.empty()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Requester] Could not resolve '{}:{}': {}", m_host, m_port, ec.message()));
		return;
	}

	// Prefer IPv4; most servers bind the IPv4 wildcard address.
	for (const auto& entry: endpoints) {
		if (entry.endpoint().address().is_v4()) {
			m_server = entry.endpoint();
			return;
		}
	}
	m_server = endpoints.begin()->endpoint();
}

QueryResult Requester::Implementation::status(std::chrono::milliseconds timeout) const {
	if (!m_server) {
		return QueryError::TransportFatal;
	}

	asio::io_context ioContext;
	asio::ip::udp::socket socket(ioContext);

	asio::error_code ec;
	socket.open(m_server->protocol(), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Requester] Could not open socket: {}", ec.message()));
		return QueryError::TransportFatal;
	}

	const auto request = encodeRequest();

	// One byte larger than any valid response so oversized datagrams are rejected rather than truncated.
	std::array<std::uint8_t, MAX_RESPONSE_BYTES + 1> buffer{};
	asio::ip::udp::endpoint sender;
	std::optional<std::size_t> receivedBytes;
	asio::error_code receiveError;
	Clock::time_point end{};

	const auto start = Clock::now();
	socket.send_to(asio::buffer(request), *m_server, 0, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Requester] Could not send request to '{}:{}': {}", m_host, m_port, ec.message()));
		return QueryError::TransportFatal;
	}

	std::function<void()> receive = [&] {
		socket.async_receive_from(asio::buffer(buffer), sender, [&](asio::error_code rec, std::size_t bytes) {
			if (rec == asio::error::operation_aborted) {
				return;
			}
			// ICMP port unreachable. Nobody listens (yet); keep waiting until the timeout.
			if (rec == asio::error::connection_refused || rec == asio::error::connection_reset) {
				receive();
				return;
			}
			if (rec) {
				receiveError = rec;
				return;
			}
			// Only the queried server may answer.
			if (sender != *m_server) {
				receive();
				return;
			}
			end           = Clock::now();
			receivedBytes = bytes;
		});
	};
	receive();
	ioContext.run_for(timeout);

	if (receiveError) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Requester] Receive from '{}:{}' failed: {}", m_host, m_port, receiveError.message()));
		return QueryError::TransportFatal;
	}
	if (!receivedBytes) {
		return QueryError::Timeout;
	}

	const auto record = decodeResponse(std::span<const std::uint8_t>(buffer.data(), *receivedBytes));
	if (!record) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Requester] Malformed response ({} bytes) from '{}:{}'.", *receivedBytes, m_host, m_port));
		return QueryError::MalformedMessage;
	}

	return StatusReply{.record = *record, .roundTrip = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)};
}


Requester::Requester(std::string host, std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(std::move(host), port)) {
}

Requester::~Requester() = default;

QueryResult Requester::status(std::chrono::milliseconds timeout) const {
	return m_pimpl->status(timeout);
}

} // namespace pulse
