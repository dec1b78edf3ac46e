#pragma once

#include "pulse/metrics.hpp"
#include "pulse/protocol.hpp"
#include "pulse/statusSource.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace pulse {

//! The transport endpoint became unusable. The caller decides whether to restart.
class TransportError : public std::runtime_error {
public:
	TransportError(std::error_code code, const std::string& what);

	const std::error_code& code() const noexcept;

private:
	std::error_code m_code;
};

struct ResponderConfig {
	std::string address{"0.0.0.0"};
	std::uint16_t port{DEFAULT_PORT}; //!< 0 binds an ephemeral port. See Responder::localPort.
	std::size_t workerThreads{2};     //!< Threads running request handlers, including the one calling run().
	std::size_t maxInFlight{256};     //!< Pending handlers above this drop new datagrams.
};

//! Answers status queries over UDP.
//! \note    Stateless: one datagram in, at most one datagram out. Malformed requests are counted and never answered.
//! \example Usage: construct, call run() on a dedicated thread, call stop() from any thread to shut down.
class Responder {
public:
	//! Opens and binds the socket. Bind failures are reported by run().
	Responder(StatusSource& source, ResponderConfig config = {});
	~Responder();

	Responder(const Responder&)            = delete;
	Responder& operator=(const Responder&) = delete;
	Responder(Responder&&)                 = delete;
	Responder& operator=(Responder&&)      = delete;

	//! Serve requests until stop() is called. Single use.
	//! \throws TransportError if the socket could not be bound or failed irrecoverably.
	//!         Exceptions escaping a request handler stop every worker and are rethrown here.
	void run(Metrics& metrics);
	void stop(); //!< Cancel run() and release the socket. Safe to call from any thread, multiple times.

	bool isBound() const;
	std::uint16_t localPort() const; //!< Bound port. 0 if not bound.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace pulse
