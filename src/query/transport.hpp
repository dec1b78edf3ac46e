#pragma once

#include <asio/error.hpp>
#include <asio/io_context.hpp>

#include <cstddef>

namespace pulse {

//! Errors that concern a single datagram. The socket stays usable.
bool isPerPacketError(const asio::error_code& ec);

//! Run the context on the calling thread plus threads - 1 worker threads until it stops.
//! The first exception thrown by a handler stops the context and is rethrown once every worker returned.
void runWorkers(asio::io_context& ioContext, std::size_t threads);

} // namespace pulse
