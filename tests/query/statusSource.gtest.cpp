#include "pulse/statusSource.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace pulse::gtest {

static StatusRecord withPlayers(std::uint16_t players) {
	return StatusRecord{.buildId = {}, .playersCount = players, .playerCap = 100, .battleMode = GlobalPvE{}};
}

class RecordingListener final : public IStatusListener {
public:
	void onStatusChanged(const StatusRecord& record, std::uint64_t version) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_records.push_back(record);
		m_versions.push_back(version);
	}

	std::vector<StatusRecord> records() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_records;
	}
	std::vector<std::uint64_t> versions() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_versions;
	}

private:
	mutable std::mutex m_mutex;
	std::vector<StatusRecord> m_records;
	std::vector<std::uint64_t> m_versions;
};

TEST(StatusSource, InitialRecord) {
	const StatusSource source(withPlayers(5));

	EXPECT_EQ(source.latest(), withPlayers(5));
	EXPECT_EQ(source.snapshot().version, 0u);
}

TEST(StatusSource, PublishIsVisibleToLaterReads) {
	StatusSource source(withPlayers(0));

	source.publish(withPlayers(1));
	EXPECT_EQ(source.latest(), withPlayers(1));

	source.publish(withPlayers(2));
	const auto snapshot = source.snapshot();
	EXPECT_EQ(snapshot.record, withPlayers(2));
	EXPECT_EQ(snapshot.version, 2u);
}

TEST(StatusSource, ReadersNeverGoBackwards) {
	constexpr std::uint16_t kPublishes = 2000;
	constexpr int kReaders             = 4;

	StatusSource source(withPlayers(0));
	std::atomic<bool> done{false};
	std::atomic<int> violations{0};

	std::vector<std::thread> readers;
	for (int i = 0; i < kReaders; ++i) {
		readers.emplace_back([&] {
			std::uint64_t lastVersion = 0;
			while (!done) {
				const auto snapshot = source.snapshot();
				// Version and record are published together. A torn read would break this.
				if (snapshot.version < lastVersion || snapshot.record.playersCount != snapshot.version) {
					++violations;
				}
				lastVersion = snapshot.version;
			}
		});
	}

	for (std::uint16_t i = 1; i <= kPublishes; ++i) {
		source.publish(withPlayers(i));
		// Once publish returned, no reader on this thread can see an older value.
		if (source.snapshot().version < i) {
			++violations;
		}
	}
	done = true;

	for (auto& reader: readers) {
		reader.join();
	}

	EXPECT_EQ(violations.load(), 0);
	EXPECT_EQ(source.latest(), withPlayers(kPublishes));
}

TEST(StatusSource, ListenerNotifiedInOrder) {
	StatusSource source(withPlayers(0));
	RecordingListener listener;

	ASSERT_TRUE(source.registerListener(&listener));
	EXPECT_FALSE(source.registerListener(&listener));
	EXPECT_FALSE(source.registerListener(nullptr));

	source.publish(withPlayers(1));
	source.publish(withPlayers(2));
	source.unregisterListener(&listener);
	source.publish(withPlayers(3));

	EXPECT_EQ(listener.records(), (std::vector<StatusRecord>{withPlayers(1), withPlayers(2)}));
	EXPECT_EQ(listener.versions(), (std::vector<std::uint64_t>{1u, 2u}));
}

//! Unregisters itself on the first notification.
class OneShotListener final : public IStatusListener {
public:
	explicit OneShotListener(StatusSource& source) : m_source(source) {
	}

	void onStatusChanged(const StatusRecord& record, std::uint64_t) override {
		m_seen.push_back(record);
		m_source.unregisterListener(this);
		// Reading the source from a callback is allowed as well.
		m_latest = m_source.latest();
	}

	StatusSource& m_source;
	std::vector<StatusRecord> m_seen;
	StatusRecord m_latest{};
};

TEST(StatusSource, ListenerMayUnregisterInCallback) {
	StatusSource source(withPlayers(0));
	OneShotListener oneShot(source);
	RecordingListener recorder;

	ASSERT_TRUE(source.registerListener(&oneShot));
	ASSERT_TRUE(source.registerListener(&recorder));

	auto published = std::async(std::launch::async, [&] {
		source.publish(withPlayers(1));
		source.publish(withPlayers(2));
	});
	ASSERT_EQ(published.wait_for(std::chrono::seconds(2)), std::future_status::ready);
	published.get();

	EXPECT_EQ(oneShot.m_seen, std::vector<StatusRecord>{withPlayers(1)});
	EXPECT_EQ(oneShot.m_latest, withPlayers(1));
	EXPECT_EQ(recorder.records(), (std::vector<StatusRecord>{withPlayers(1), withPlayers(2)}));

	// Registration slot was released.
	EXPECT_TRUE(source.registerListener(&oneShot));
}

TEST(StatusSource, WaitForUpdate) {
	StatusSource source(withPlayers(0));

	EXPECT_FALSE(source.waitForUpdate(0, std::chrono::milliseconds(10)));

	std::thread producer([&] {
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
		source.publish(withPlayers(7));
	});

	EXPECT_TRUE(source.waitForUpdate(0, std::chrono::seconds(2)));
	EXPECT_EQ(source.latest(), withPlayers(7));
	producer.join();

	// Already newer than the seen version: returns at once.
	EXPECT_TRUE(source.waitForUpdate(0, std::chrono::milliseconds(0)));
}

} // namespace pulse::gtest
