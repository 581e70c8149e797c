#pragma once

#include "error.hpp"
#include "types.hpp"

#include <expected>
#include <vector>

namespace chunking {

// Splits [0, duration] into windows of chunk_length seconds, each starting
// `overlap` seconds before the previous one ended. The last window ends at
// duration exactly. A clip no longer than one chunk yields a single window.
std::expected<std::vector<ChunkWindow>, Error>
plan(double duration, double chunk_length, double overlap);

} // namespace chunking
