#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "abort_signal.hpp"
#include "errors.hpp"
#include "host/event_loop.hpp"
#include "host/queuing_strategy.hpp"
#include "host/readable_stream.hpp"
#include "log.hpp"
#include "readable/into_stream.hpp"
#include "readable/into_underlying_source.hpp"

namespace wstreams {

/// Creates a host readable stream that pulls its chunks from `stream`.
///
/// The high water mark defaults to 0: the stream then only pulls when a read is waiting,
/// and the sequence itself decides how far ahead it runs.
template<result_stream Stream>
host::readable_stream from_stream(
    host::event_loop& loop,
    Stream stream,
    host::queuing_strategy strategy = host::count_queuing_strategy(0)
) {
    auto source = std::make_unique<into_underlying_source<Stream>>(loop, std::move(stream));
    return host::readable_stream(loop, std::move(source), std::move(strategy));
}

inline reader_stream_awaitable into_stream(
    host::readable_stream_default_reader reader, std::optional<abort_signal> signal = std::nullopt
) {
    return reader_stream_awaitable(std::move(reader), std::move(signal));
}

/// Locks `stream` and reads it as a sequence. Throws lock_error if it is already locked.
inline reader_stream_awaitable into_stream(
    host::readable_stream& stream, std::optional<abort_signal> signal = std::nullopt
) {
    try {
        return into_stream(stream.get_reader(), std::move(signal));
    } catch (const lock_error& e) {
        log(log_level::warning, "into_stream: ", e.what());
        throw;
    }
}

}  // namespace wstreams
