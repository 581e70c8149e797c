#include "chunk_planner.hpp"

#include <algorithm>
#include <format>

namespace chunking {

std::expected<std::vector<ChunkWindow>, Error>
plan(double duration, double chunk_length, double overlap) {
    if (chunk_length <= 0.0) {
        return std::unexpected(Error{ErrorKind::Configuration,
            std::format("chunk length must be positive, got {}", chunk_length)});
    }
    if (overlap < 0.0 || overlap >= chunk_length) {
        return std::unexpected(Error{ErrorKind::Configuration,
            std::format("overlap {} must be in [0, {})", overlap, chunk_length)});
    }
    if (duration <= 0.0) {
        return std::unexpected(Error{ErrorKind::Configuration,
            std::format("duration must be positive, got {}", duration)});
    }

    if (duration <= chunk_length) {
        return std::vector<ChunkWindow>{{.index = 0, .start = 0.0, .end = duration}};
    }

    std::vector<ChunkWindow> windows;
    double start = 0.0;
    for (int index = 0;; ++index) {
        double end = std::min(start + chunk_length, duration);
        windows.push_back({.index = index, .start = start, .end = end});
        if (end >= duration) break;
        start = end - overlap;
    }
    return windows;
}

} // namespace chunking
