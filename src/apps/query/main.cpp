#include "pulse/requester.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <string_view>

template <typename T>
static std::optional<T> parseNumber(std::string_view text) {
	T value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size()) {
		return {};
	}
	return value;
}

int main(int argc, char** argv) {
	if (argc < 2) {
		std::cerr << "Usage: pulse_query <host> [port] [count] [timeoutMs]\n";
		return 2;
	}

	const auto port      = argc > 2 ? parseNumber<std::uint16_t>(argv[2]) : pulse::DEFAULT_PORT;
	const auto count     = argc > 3 ? parseNumber<unsigned>(argv[3]) : 1u;
	const auto timeoutMs = argc > 4 ? parseNumber<unsigned>(argv[4]) : 1000u;
	if (!port || !count || !timeoutMs) {
		std::cerr << "Port, count and timeout must be unsigned integers.\n";
		return 2;
	}

	const pulse::Requester requester(argv[1], *port);

	unsigned succeeded = 0;
	for (unsigned i = 0; i < *count; ++i) {
		const auto result = requester.status(std::chrono::milliseconds(*timeoutMs));

		if (const auto* error = std::get_if<pulse::QueryError>(&result)) {
			std::cout << std::format("[{}] Query failed: {}\n", i + 1, pulse::toString(*error));
			if (*error == pulse::QueryError::TransportFatal) {
				break;
			}
			continue;
		}

		const auto& reply = std::get<pulse::StatusReply>(result);
		const auto ping   = std::chrono::duration<double, std::milli>(reply.roundTrip);
		std::cout << std::format("[{}] Ping = {:.3f}ms, {}\n", i + 1, ping.count(), pulse::toString(reply.record));
		++succeeded;
	}

	return succeeded > 0 ? 0 : 1;
}
