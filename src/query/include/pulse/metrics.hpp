#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace pulse {

//! Plain copy of the counters at one point in time.
struct MetricsSnapshot {
	std::uint64_t requestsReceived{0}; //!< Datagrams handed to a request handler.
	std::uint64_t responsesSent{0};    //!< Responses the transport accepted.
	std::uint64_t decodeErrors{0};     //!< Malformed requests. Never answered.
	std::uint64_t sendErrors{0};       //!< Responses the transport rejected.
	std::uint64_t receiveErrors{0};    //!< Per-packet receive errors.
	std::uint64_t droppedRequests{0};  //!< Datagrams dropped because the in-flight cap was reached.

	std::chrono::microseconds processingTimeTotal{0}; //!< Decode to send completion, summed over all responses.

	std::chrono::microseconds averageProcessingTime() const;

	bool operator==(const MetricsSnapshot&) const = default;
};

//! Counters shared by all request handlers of a Responder.
//! \note Counters only ever increase. Reads never block writers.
class Metrics {
public:
	Metrics() = default;

	Metrics(const Metrics&)            = delete;
	Metrics& operator=(const Metrics&) = delete;

	MetricsSnapshot snapshot() const; //!< Copy of every counter. Each field is read atomically.

	//! Increments. Public so a Responder can share one instance with operator code reading snapshot().
	//! Only the Responder that was handed this instance is expected to call them.
	void countRequest();
	void countResponse(std::chrono::microseconds processingTime);
	void countDecodeError();
	void countSendError();
	void countReceiveError();
	void countDropped();

private:
	std::atomic<std::uint64_t> m_requestsReceived{0};
	std::atomic<std::uint64_t> m_responsesSent{0};
	std::atomic<std::uint64_t> m_decodeErrors{0};
	std::atomic<std::uint64_t> m_sendErrors{0};
	std::atomic<std::uint64_t> m_receiveErrors{0};
	std::atomic<std::uint64_t> m_droppedRequests{0};
	std::atomic<std::uint64_t> m_processingMicros{0};
};

//! Single line summary for operator logs.
std::string toString(const MetricsSnapshot& snapshot);

} // namespace pulse
