#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>
#include <string>

nlohmann::json to_json(const ChunkResult& chunk);
nlohmann::json to_json(const TranscriptionOutcome& outcome);
