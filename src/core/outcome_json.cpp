#include "outcome_json.hpp"

using json = nlohmann::json;

json to_json(const ChunkResult& chunk) {
    json j = {
        {"index", chunk.index},
        {"start", chunk.start},
        {"end", chunk.end},
        {"status", chunk.ok() ? "ok" : "failed"},
        {"text", chunk.text},
        {"confidence", chunk.confidence},
    };
    if (chunk.error) {
        j["error"] = {
            {"kind", std::string(to_string(chunk.error->kind))},
            {"message", chunk.error->message},
        };
    }
    return j;
}

json to_json(const TranscriptionOutcome& outcome) {
    json j = {
        {"status", to_string(outcome.status)},
        {"transcript", outcome.transcript},
        {"duration", outcome.duration},
        {"confidence", outcome.confidence},
        {"processing_time", outcome.processing_time},
        {"chunks_processed", outcome.chunks_processed},
        {"chunks_total", outcome.chunks_total},
        {"fast_path", outcome.fast_path},
        {"chunks", json::array()},
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
    for (auto& c : outcome.chunks) {
        j["chunks"].push_back(to_json(c));
    }
    return j;
}
