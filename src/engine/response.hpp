#pragma once

#include "engine/engine.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

namespace engine {

std::string trim(const std::string& text);

// Confidence in [0, 1] from a transcription response: mean of
// exp(avg_logprob) over segments, else mean token probability, else 1.0
// for a non-empty text and 0.0 for an empty one.
double confidence_from_segments(const nlohmann::json& segments, const std::string& text);

// Body returned by a whisper.cpp server or an OpenAI-compatible endpoint.
std::expected<EngineResult, Error> parse_server_response(const std::string& body);

// File written by `whisper-cli -ojf`.
std::expected<EngineResult, Error> parse_cli_output(const std::string& body);

} // namespace engine
