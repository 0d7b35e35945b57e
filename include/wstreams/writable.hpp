#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "abort_signal.hpp"
#include "errors.hpp"
#include "host/event_loop.hpp"
#include "host/queuing_strategy.hpp"
#include "host/writable_stream.hpp"
#include "log.hpp"
#include "sink.hpp"
#include "value.hpp"
#include "writable/into_sink.hpp"
#include "writable/into_underlying_sink.hpp"

namespace wstreams {

/// Creates a host writable stream that sends every chunk written to it into `sink`.
template<typename Sink>
    requires sink<Sink, value>
host::writable_stream from_sink(
    host::event_loop& loop, Sink sink, host::queuing_strategy strategy = {}
) {
    auto underlying = std::make_unique<into_underlying_sink<Sink>>(loop, std::move(sink));
    return host::writable_stream(loop, std::move(underlying), std::move(strategy));
}

inline writer_sink into_sink(
    host::writable_stream_default_writer writer, std::optional<abort_signal> signal = std::nullopt
) {
    return writer_sink(std::move(writer), std::move(signal));
}

/// Locks `stream` and exposes it as a sink. Throws lock_error if it is already locked.
inline writer_sink into_sink(
    host::writable_stream& stream, std::optional<abort_signal> signal = std::nullopt
) {
    try {
        return into_sink(stream.get_writer(), std::move(signal));
    } catch (const lock_error& e) {
        log(log_level::warning, "into_sink: ", e.what());
        throw;
    }
}

}  // namespace wstreams
