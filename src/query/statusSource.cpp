#include "pulse/statusSource.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace pulse {

StatusSource::StatusSource(StatusRecord initial) : m_current(std::make_shared<const Entry>(Entry{.record = initial, .version = 0})) {
}

void StatusSource::publish(const StatusRecord& record) {
	std::lock_guard<std::mutex> publishLock(m_publishMutex);

	// Build the new entry before taking the reader lock so the swap is the only work done under it.
	auto next = std::make_shared<const Entry>(Entry{.record = record, .version = current()->version + 1});
	const auto version = next->version;
	{
		std::lock_guard<std::mutex> lock(m_currentMutex);
		m_current.swap(next);
	}
	m_updated.notify_all();

	Logger().Log(Logging::LogLevel::Debug, std::format("[StatusSource] Published version {}: {}.", version, toString(record)));

	// Dispatch on a copy so listeners may unregister from within their callback.
	std::vector<IStatusListener*> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_listeners;
	}
	for (auto* listener: listeners) {
		listener->onStatusChanged(record, version);
	}
}

StatusRecord StatusSource::latest() const {
	return current()->record;
}

StatusSource::Snapshot StatusSource::snapshot() const {
	const auto entry = current();
	return Snapshot{.record = entry->record, .version = entry->version};
}

bool StatusSource::waitForUpdate(std::uint64_t seenVersion, std::chrono::milliseconds timeout) const {
	std::unique_lock<std::mutex> lock(m_currentMutex);
	return m_updated.wait_for(lock, timeout, [&] { return m_current->version > seenVersion; });
}

bool StatusSource::registerListener(IStatusListener* listener) {
	if (!listener) {
		return false;
	}

	std::lock_guard<std::mutex> lock(m_listenerMutex);
	if (std::ranges::find(m_listeners, listener) != m_listeners.end()) {
		return false;
	}
	m_listeners.push_back(listener);
	return true;
}

void StatusSource::unregisterListener(IStatusListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	std::erase(m_listeners, listener);
}

std::shared_ptr<const StatusSource::Entry> StatusSource::current() const {
	std::lock_guard<std::mutex> lock(m_currentMutex);
	return m_current;
}

} // namespace pulse
