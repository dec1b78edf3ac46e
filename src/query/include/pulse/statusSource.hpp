#pragma once

#include "pulse/statusRecord.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace pulse {

//! Notified after a new status record was published.
//! \note Called on the publisher's thread. Keep handlers lightweight.
//!       Handlers may read the source and unregister listeners, but must not publish.
class IStatusListener {
public:
	virtual ~IStatusListener()                                                       = default;
	virtual void onStatusChanged(const StatusRecord& record, std::uint64_t version) = 0;
};

//! Holds the latest status record. A single producer publishes, any number of readers read.
//! Records are immutable once published; publishing swaps the current pointer.
class StatusSource {
public:
	struct Snapshot {
		StatusRecord record;
		std::uint64_t version; //!< 0 for the initial record, incremented by every publish.
	};

	explicit StatusSource(StatusRecord initial);

	StatusSource(const StatusSource&)            = delete;
	StatusSource& operator=(const StatusSource&) = delete;

	//! Make a new record current. Every read started after this returns observes it or a newer record.
	void publish(const StatusRecord& record);

	StatusRecord latest() const; //!< Never waits for a producer beyond the pointer copy.
	Snapshot snapshot() const;   //!< Latest record together with its version.

	//! Block until a version newer than seenVersion is published. Returns false on timeout.
	bool waitForUpdate(std::uint64_t seenVersion, std::chrono::milliseconds timeout) const;

	bool registerListener(IStatusListener* listener); //!< Returns false if null or already registered.
	//! A publish running concurrently may still notify the listener once after this returned.
	void unregisterListener(IStatusListener* listener);

private:
	struct Entry {
		StatusRecord record;
		std::uint64_t version;
	};

	std::shared_ptr<const Entry> current() const;

private:
	mutable std::mutex m_currentMutex;         //!< Guards the pointer only, never the record.
	mutable std::condition_variable m_updated; //!< Signalled after every swap.
	std::shared_ptr<const Entry> m_current;    //!< Current published record.

	std::mutex m_publishMutex; //!< Serializes publishers so versions and notifications stay ordered.

	std::mutex m_listenerMutex;
	std::vector<IStatusListener*> m_listeners;
};

} // namespace pulse
