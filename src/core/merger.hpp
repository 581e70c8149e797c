#pragma once

#include "types.hpp"

#include <span>
#include <string>

struct MergedTranscript {
    std::string text;
    double confidence = 0.0;
    int ok_chunks = 0;
};

namespace merge {

struct Options {
    // Drop words repeated across a chunk boundary (audio overlap re-transcribed).
    bool dedupe_overlap = false;
    size_t max_overlap_words = 16;
    size_t min_overlap_words = 2;
};

// Trims, collapses whitespace runs and repeated sentence punctuation.
std::string clean_text(const std::string& text);

// Number of words ending `merged` that also start `next` (case-insensitive),
// longest match first, within [min_words, max_words]. 0 if none.
size_t overlap_words(const std::string& merged, const std::string& next,
                     size_t min_words, size_t max_words);

// Joins Ok chunks in index order with single spaces; Failed chunks are
// skipped. Confidence is the mean over Ok chunks, 0.0 when there are none.
MergedTranscript merge_results(std::span<const ChunkResult> results,
                               const Options& opts = {});

} // namespace merge
