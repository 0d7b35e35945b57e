#pragma once

#include <functional>

#include "../value.hpp"

namespace wstreams::host {

/// How much a stream buffers before it signals backpressure. A stream's desired size is
/// high_water_mark minus the summed sizes of the queued chunks.
struct queuing_strategy {
    double high_water_mark = 1;

    // Size of one chunk. Left empty every chunk counts as 1.
    std::function<double(const value&)> size;

    double chunk_size(const value& chunk) const {
        return size ? size(chunk) : 1;
    }
};

inline queuing_strategy count_queuing_strategy(double high_water_mark) {
    return queuing_strategy{high_water_mark, nullptr};
}

}  // namespace wstreams::host
