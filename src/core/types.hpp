#pragma once

#include "error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// A probed local input file. Immutable once the pipeline has built it.
struct AudioSource {
    std::filesystem::path path;
    double duration_s = 0.0;
    std::string language;
};

struct ChunkWindow {
    int index = 0;
    double start = 0.0;
    double end = 0.0;

    double length() const { return end - start; }

    bool operator==(const ChunkWindow&) const = default;
};

enum class ChunkStatus { Ok, Failed };

struct ChunkResult {
    int index = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    double confidence = 0.0;
    ChunkStatus status = ChunkStatus::Failed;
    std::optional<Error> error;

    bool ok() const { return status == ChunkStatus::Ok; }
};

enum class OutcomeStatus { Success, Partial, Timeout, Failed };

inline const char* to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Success: return "success";
        case OutcomeStatus::Partial: return "partial";
        case OutcomeStatus::Timeout: return "timeout";
        case OutcomeStatus::Failed: return "failed";
    }
    return "failed";
}

struct TranscriptionOutcome {
    OutcomeStatus status = OutcomeStatus::Failed;
    std::string transcript;
    double duration = 0.0;
    double confidence = 0.0;
    double processing_time = 0.0;
    int chunks_processed = 0;
    int chunks_total = 0;
    bool fast_path = false;
    std::optional<std::string> error;
    std::vector<ChunkResult> chunks;
};
