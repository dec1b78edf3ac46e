#include "pulse/config.hpp"
#include "pulse/console.hpp"
#include "pulse/metrics.hpp"
#include "pulse/responder.hpp"
#include "pulse/statusSource.hpp"

#include <atomic>
#include <exception>
#include <format>
#include <iostream>
#include <thread>

int main(int argc, char** argv) {
	pulse::ServerConfig config{};
	if (argc > 1) {
		const auto loaded = pulse::loadConfig(argv[1]);
		if (!loaded) {
			std::cerr << std::format("Could not load configuration '{}'.\n", argv[1]);
			return 1;
		}
		config = *loaded;
	}

	pulse::StatusSource source(config.initialStatus);
	pulse::Metrics metrics;
	pulse::Responder responder(source, config.responder);
	if (!responder.isBound()) {
		std::cerr << std::format("Could not bind '{}:{}'.\n", config.responder.address, config.responder.port);
		return 1;
	}

	std::atomic<bool> failed{false};
	std::thread responderThread([&] {
		try {
			responder.run(metrics);
		} catch (const std::exception& ex) {
			std::cerr << std::format("Responder stopped: {}\nThe server exits on the next command.\n", ex.what());
			failed = true;
		}
	});

	std::cout << std::format("Serving status on port {}: {}\n", responder.localPort(), pulse::toString(source.latest()));

	// Keep the server process alive until stdin closes, quit command or the responder failed.
	pulse::runConsole(std::cin, std::cout, source, metrics, [&] { return !failed; });

	responder.stop();
	if (responderThread.joinable()) {
		responderThread.join();
	}

	std::cout << pulse::toString(metrics.snapshot()) << "\n";
	return failed ? 1 : 0;
}
