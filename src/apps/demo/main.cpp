#include "pulse/metrics.hpp"
#include "pulse/requester.hpp"
#include "pulse/responder.hpp"
#include "pulse/statusSource.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <thread>

//! Serves a fixed status on loopback and queries it.
int main(int, char**) {
	static const pulse::StatusRecord DEFAULT_STATUS{
	        .buildId      = {},
	        .playersCount = 100,
	        .playerCap    = 300,
	        .battleMode   = pulse::GlobalPvE{},
	};

	pulse::StatusSource source(DEFAULT_STATUS);
	pulse::Metrics metrics;
	pulse::Responder responder(source, {.address = "127.0.0.1", .port = pulse::DEFAULT_PORT, .workerThreads = 2, .maxInFlight = 64});

	std::thread responderThread([&] {
		try {
			responder.run(metrics);
		} catch (const pulse::TransportError& ex) {
			std::cerr << std::format("Responder stopped: {}\n", ex.what());
		}
	});

	const pulse::Requester requester("127.0.0.1", pulse::DEFAULT_PORT);

	int exitCode     = 0;
	const auto first = requester.status(std::chrono::seconds(1));
	if (const auto* reply = std::get_if<pulse::StatusReply>(&first)) {
		std::cout << std::format("Ping = {}ms\n", std::chrono::duration_cast<std::chrono::milliseconds>(reply->roundTrip).count());
		std::cout << std::format("Server info: {}\n", pulse::toString(reply->record));
		if (reply->record != DEFAULT_STATUS) {
			std::cerr << "Server info does not match the served status.\n";
			exitCode = 1;
		}
	} else {
		std::cerr << std::format("Server info request error: {}\n", pulse::toString(std::get<pulse::QueryError>(first)));
		exitCode = 1;
	}

	const auto start = std::chrono::steady_clock::now();
	for (int i = 0; i < 32; ++i) {
		const auto result = requester.status(std::chrono::seconds(1));
		if (const auto* error = std::get_if<pulse::QueryError>(&result)) {
			std::cerr << std::format("Server info request error: {}\n", pulse::toString(*error));
		}
	}
	const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

	std::cout << std::format("Metrics = {}\n", pulse::toString(metrics.snapshot()));
	std::cout << std::format("Elapsed = {}us\n", elapsed.count());

	responder.stop();
	if (responderThread.joinable()) {
		responderThread.join();
	}
	return exitCode;
}
