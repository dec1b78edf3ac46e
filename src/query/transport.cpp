#include "transport.hpp"

#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pulse {

bool isPerPacketError(const asio::error_code& ec) {
	return ec == asio::error::connection_refused || ec == asio::error::connection_reset || ec == asio::error::message_size ||
	       ec == asio::error::would_block || ec == asio::error::try_again || ec == asio::error::interrupted ||
	       ec == asio::error::network_unreachable || ec == asio::error::host_unreachable;
}

void runWorkers(asio::io_context& ioContext, std::size_t threads) {
	std::mutex errorMutex;
	std::exception_ptr error;

	auto work = [&] {
		try {
			ioContext.run();
		} catch (...) {
			{
				std::lock_guard<std::mutex> lock(errorMutex);
				if (!error) {
					error = std::current_exception();
				}
			}
			ioContext.stop();
		}
	};

	// The calling thread is the first worker.
	std::vector<std::thread> workers;
	try {
		for (std::size_t i = 1; i < threads; ++i) {
			workers.emplace_back(work);
		}
	} catch (...) {
		ioContext.stop();
		for (auto& worker: workers) {
			worker.join();
		}
		throw;
	}

	work();
	for (auto& worker: workers) {
		worker.join();
	}

	if (error) {
		std::rethrow_exception(error);
	}
}

} // namespace pulse
