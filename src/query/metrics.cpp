#include "pulse/metrics.hpp"

#include <format>

namespace pulse {

std::chrono::microseconds MetricsSnapshot::averageProcessingTime() const {
	if (responsesSent == 0) {
		return std::chrono::microseconds{0};
	}
	return processingTimeTotal / static_cast<std::chrono::microseconds::rep>(responsesSent);
}

MetricsSnapshot Metrics::snapshot() const {
	// Responses are read before requests so a snapshot never shows more responses than requests.
	const auto responses  = m_responsesSent.load(std::memory_order_acquire);
	const auto processing = m_processingMicros.load(std::memory_order_acquire);

	return MetricsSnapshot{
	        .requestsReceived    = m_requestsReceived.load(std::memory_order_acquire),
	        .responsesSent       = responses,
	        .decodeErrors        = m_decodeErrors.load(std::memory_order_acquire),
	        .sendErrors          = m_sendErrors.load(std::memory_order_acquire),
	        .receiveErrors       = m_receiveErrors.load(std::memory_order_acquire),
	        .droppedRequests     = m_droppedRequests.load(std::memory_order_acquire),
	        .processingTimeTotal = std::chrono::microseconds{static_cast<std::chrono::microseconds::rep>(processing)},
	};
}

void Metrics::countRequest() {
	m_requestsReceived.fetch_add(1, std::memory_order_release);
}

void Metrics::countResponse(std::chrono::microseconds processingTime) {
	const auto micros = processingTime.count() > 0 ? static_cast<std::uint64_t>(processingTime.count()) : 0u;
	m_processingMicros.fetch_add(micros, std::memory_order_release);
	m_responsesSent.fetch_add(1, std::memory_order_release);
}

void Metrics::countDecodeError() {
	m_decodeErrors.fetch_add(1, std::memory_order_release);
}

void Metrics::countSendError() {
	m_sendErrors.fetch_add(1, std::memory_order_release);
}

void Metrics::countReceiveError() {
	m_receiveErrors.fetch_add(1, std::memory_order_release);
}

void Metrics::countDropped() {
	m_droppedRequests.fetch_add(1, std::memory_order_release);
}

std::string toString(const MetricsSnapshot& snapshot) {
	return std::format("requests={}, responses={}, decodeErrors={}, sendErrors={}, receiveErrors={}, dropped={}, avgProcessing={}us",
	                   snapshot.requestsReceived, snapshot.responsesSent, snapshot.decodeErrors, snapshot.sendErrors, snapshot.receiveErrors,
	                   snapshot.droppedRequests, snapshot.averageProcessingTime().count());
}

} // namespace pulse
