#include "pulse/metrics.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace pulse::gtest {

TEST(Metrics, StartsAtZero) {
	const Metrics metrics;
	EXPECT_EQ(metrics.snapshot(), MetricsSnapshot{});
	EXPECT_EQ(metrics.snapshot().averageProcessingTime(), std::chrono::microseconds{0});
}

TEST(Metrics, CountersAreIndependent) {
	Metrics metrics;
	metrics.countRequest();
	metrics.countRequest();
	metrics.countRequest();
	metrics.countResponse(std::chrono::microseconds{10});
	metrics.countResponse(std::chrono::microseconds{30});
	metrics.countDecodeError();
	metrics.countSendError();
	metrics.countReceiveError();
	metrics.countDropped();

	const auto snapshot = metrics.snapshot();
	EXPECT_EQ(snapshot.requestsReceived, 3u);
	EXPECT_EQ(snapshot.responsesSent, 2u);
	EXPECT_EQ(snapshot.decodeErrors, 1u);
	EXPECT_EQ(snapshot.sendErrors, 1u);
	EXPECT_EQ(snapshot.receiveErrors, 1u);
	EXPECT_EQ(snapshot.droppedRequests, 1u);
	EXPECT_EQ(snapshot.processingTimeTotal, std::chrono::microseconds{40});
	EXPECT_EQ(snapshot.averageProcessingTime(), std::chrono::microseconds{20});
}

TEST(Metrics, ConcurrentIncrementsAreNotLost) {
	constexpr int kThreads    = 8;
	constexpr int kIncrements = 10000;

	Metrics metrics;
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; ++i) {
		threads.emplace_back([&] {
			for (int j = 0; j < kIncrements; ++j) {
				metrics.countRequest();
				metrics.countResponse(std::chrono::microseconds{1});
			}
		});
	}

	// Snapshots taken while writers run never show more responses than requests.
	bool consistent = true;
	for (int i = 0; i < 1000; ++i) {
		const auto snapshot = metrics.snapshot();
		consistent          = consistent && snapshot.responsesSent <= snapshot.requestsReceived;
	}

	for (auto& thread: threads) {
		thread.join();
	}

	const auto snapshot = metrics.snapshot();
	EXPECT_TRUE(consistent);
	EXPECT_EQ(snapshot.requestsReceived, static_cast<std::uint64_t>(kThreads * kIncrements));
	EXPECT_EQ(snapshot.responsesSent, static_cast<std::uint64_t>(kThreads * kIncrements));
	EXPECT_EQ(snapshot.processingTimeTotal, std::chrono::microseconds{kThreads * kIncrements});
}

TEST(Metrics, ToString) {
	Metrics metrics;
	metrics.countRequest();
	metrics.countResponse(std::chrono::microseconds{12});

	EXPECT_EQ(toString(metrics.snapshot()), "requests=1, responses=1, decodeErrors=0, sendErrors=0, receiveErrors=0, dropped=0, avgProcessing=12us");
}

} // namespace pulse::gtest
