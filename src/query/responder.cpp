#include "pulse/responder.hpp"

#include "Logging.hpp"
#include "transport.hpp"

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace pulse {

using Clock = std::chrono::steady_clock;

TransportError::TransportError(std::error_code code, const std::string& what)
    : std::runtime_error(std::format("{}: {}", what, code.message())), m_code(code) {
}

const std::error_code& TransportError::code() const noexcept {
	return m_code;
}

static std::string toString(const asio::ip::udp::endpoint& endpoint) {
	return std::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

class Responder::Implementation {
public:
	Implementation(StatusSource& source, ResponderConfig config);

	void run(Metrics& metrics);
	void stop();

	bool isBound() const;
	std::uint16_t localPort() const;

private:
	void startReceive(); //!< Prime async receive. Runs on the socket strand.
	void onReceive(const asio::error_code& ec, std::size_t bytes);

	//! Runs on any pool thread. Decodes, reads the latest status and queues the response.
	void handleRequest(const Bytes& datagram, const asio::ip::udp::endpoint& peer, Clock::time_point received);
	void sendResponse(std::shared_ptr<const Bytes> response, asio::ip::udp::endpoint peer, Clock::time_point received);

	void fail(const asio::error_code& ec); //!< Record a fatal transport error and stop serving.

private:
	StatusSource& m_source;
	const ResponderConfig m_config;

	asio::io_context m_ioContext{};
	asio::strand<asio::io_context::executor_type> m_socketStrand; //!< All socket operations run here.
	asio::ip::udp::socket m_socket;

	asio::error_code m_bindError;
	std::uint16_t m_localPort{0};

	//! One byte larger than the largest request so oversized datagrams fail to decode instead of being truncated into valid ones.
	std::array<std::uint8_t, MAX_REQUEST_BYTES + 1> m_receiveBuffer{};
	asio::ip::udp::endpoint m_peer; //!< Sender of the datagram in m_receiveBuffer.

	Metrics* m_metrics{nullptr};
	std::atomic<bool> m_started{false};
	std::atomic<bool> m_stopped{false};
	std::atomic<std::size_t> m_inFlight{0};

	std::mutex m_errorMutex;
	asio::error_code m_fatalError; //!< Set once the socket failed. Rethrown by run().
};


Responder::Implementation::Implementation(StatusSource& source, ResponderConfig config)
    : m_source(source), m_config(std::move(config)), m_socketStrand(asio::make_strand(m_ioContext)), m_socket(m_ioContext) {
	// Stay in error_code land. run() reports the failure.
	auto logBindError = [this](const char* step) {
		Logger().Log(Logging::LogLevel::Error,
		             std::format("[Responder] Could not {} '{}:{}': {}", step, m_config.address, m_config.port, m_bindError.message()));
	};

	const auto address = asio::ip::make_address(m_config.address, m_bindError);
	if (m_bindError) {
		logBindError("parse address");
		return;
	}

	const asio::ip::udp::endpoint endpoint(address, m_config.port);
	m_socket.open(endpoint.protocol(), m_bindError);
	if (m_bindError) {
		logBindError("open socket for");
		return;
	}
	m_socket.bind(endpoint, m_bindError);
	if (m_bindError) {
		logBindError("bind");
		asio::error_code ec;
		m_socket.close(ec);
		return;
	}

	asio::error_code ec;
	m_localPort = m_socket.local_endpoint(ec).port();
	Logger().Log(Logging::LogLevel::Info, std::format("[Responder] Bound to '{}:{}'.", m_config.address, m_localPort));
}

void Responder::Implementation::run(Metrics& metrics) {
	if (m_bindError) {
		throw TransportError(m_bindError, std::format("Responder could not bind '{}:{}'", m_config.address, m_config.port));
	}
	if (m_started.exchange(true)) {
		Logger().Log(Logging::LogLevel::Warning, "[Responder] run() called twice. Ignored.");
		return;
	}
	if (m_stopped) {
		asio::error_code ec;
		m_socket.close(ec);
		return;
	}

	m_metrics = &metrics;
	asio::post(m_socketStrand, [this] { startReceive(); });

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info,
	           std::format("[Responder] Serving on port {} with {} worker thread(s).", m_localPort, std::max<std::size_t>(m_config.workerThreads, 1)));
	logger.Flush();

	std::exception_ptr handlerError;
	try {
		runWorkers(m_ioContext, std::max<std::size_t>(m_config.workerThreads, 1));
	} catch (const std::exception& ex) {
		logger.Log(Logging::LogLevel::Error, std::format("[Responder] Request handler failed: {}", ex.what()));
		handlerError = std::current_exception();
	}
	m_stopped = true;

	// No thread touches the socket anymore.
	asio::error_code ec;
	m_socket.close(ec);

	if (handlerError) {
		std::rethrow_exception(handlerError);
	}

	asio::error_code fatal;
	{
		std::lock_guard<std::mutex> lock(m_errorMutex);
		fatal = m_fatalError;
	}
	if (fatal) {
		logger.Log(Logging::LogLevel::Error, std::format("[Responder] Stopped on transport error: {}", fatal.message()));
		throw TransportError(fatal, "Responder transport failed");
	}

	logger.Log(Logging::LogLevel::Info, "[Responder] Stopped.");
}

void Responder::Implementation::stop() {
	if (m_stopped.exchange(true)) {
		return;
	}
	// Pending handlers are abandoned. run() closes the socket once all workers returned.
	m_ioContext.stop();
}

bool Responder::Implementation::isBound() const {
	return !m_bindError;
}

std::uint16_t Responder::Implementation::localPort() const {
	return m_localPort;
}

void Responder::Implementation::startReceive() {
	m_socket.async_receive_from(asio::buffer(m_receiveBuffer), m_peer,
	                            asio::bind_executor(m_socketStrand, [this](asio::error_code ec, std::size_t bytes) { onReceive(ec, bytes); }));
}

void Responder::Implementation::onReceive(const asio::error_code& ec, std::size_t bytes) {
	if (m_stopped || ec == asio::error::operation_aborted) {
		return;
	}

	if (ec) {
		if (!isPerPacketError(ec)) {
			fail(ec);
			return;
		}
		m_metrics->countReceiveError();
		Logger().Log(Logging::LogLevel::Warning, std::format("[Responder] Receive error from '{}': {}", toString(m_peer), ec.message()));
		startReceive();
		return;
	}

	const auto received = Clock::now();
	if (m_inFlight.load() >= m_config.maxInFlight) {
		m_metrics->countDropped();
		Logger().Log(Logging::LogLevel::Debug, std::format("[Responder] In-flight limit reached. Dropped request from '{}'.", toString(m_peer)));
		startReceive();
		return;
	}

	++m_inFlight;
	Bytes datagram(m_receiveBuffer.begin(), m_receiveBuffer.begin() + static_cast<std::ptrdiff_t>(bytes));
	asio::post(m_ioContext, [this, datagram = std::move(datagram), peer = m_peer, received] { handleRequest(datagram, peer, received); });

	startReceive();
}

void Responder::Implementation::handleRequest(const Bytes& datagram, const asio::ip::udp::endpoint& peer, Clock::time_point received) {
	m_metrics->countRequest();

	if (!decodeRequest(datagram)) {
		// Never answer malformed input.
		--m_inFlight;
		m_metrics->countDecodeError();
		Logger().Log(Logging::LogLevel::Debug, std::format("[Responder] Malformed request ({} bytes) from '{}'.", datagram.size(), toString(peer)));
		return;
	}

	auto response = std::make_shared<const Bytes>(encodeResponse(m_source.latest()));
	asio::post(m_socketStrand, [this, response = std::move(response), peer, received]() mutable { sendResponse(std::move(response), peer, received); });
}

void Responder::Implementation::sendResponse(std::shared_ptr<const Bytes> response, asio::ip::udp::endpoint peer, Clock::time_point received) {
	const auto buffer = asio::buffer(*response);
	m_socket.async_send_to(buffer, peer,
	                       asio::bind_executor(m_socketStrand, [this, response = std::move(response), peer, received](asio::error_code ec, std::size_t) {
		                       --m_inFlight;
		                       if (ec == asio::error::operation_aborted) {
			                       return;
		                       }
		                       if (ec) {
			                       m_metrics->countSendError();
			                       Logger().Log(Logging::LogLevel::Warning,
			                                    std::format("[Responder] Could not send response to '{}': {}", toString(peer), ec.message()));
			                       return;
		                       }
		                       m_metrics->countResponse(std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - received));
	                       }));
}

void Responder::Implementation::fail(const asio::error_code& ec) {
	{
		std::lock_guard<std::mutex> lock(m_errorMutex);
		if (!m_fatalError) {
			m_fatalError = ec;
		}
	}
	m_stopped = true;
	m_ioContext.stop();
}


Responder::Responder(StatusSource& source, ResponderConfig config) : m_pimpl(std::make_unique<Implementation>(source, std::move(config))) {
}

Responder::~Responder() {
	stop();
}

void Responder::run(Metrics& metrics) {
	m_pimpl->run(metrics);
}

void Responder::stop() {
	m_pimpl->stop();
}

bool Responder::isBound() const {
	return m_pimpl->isBound();
}

std::uint16_t Responder::localPort() const {
	return m_pimpl->localPort();
}

} // namespace pulse
