#include "engine/response.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace engine {

namespace {

std::unexpected<Error> engine_error(std::string msg) {
    return std::unexpected(Error{ErrorKind::Engine, std::move(msg)});
}

} // namespace

std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

double confidence_from_segments(const json& segments, const std::string& text) {
    double fallback = text.empty() ? 0.0 : 1.0;
    if (!segments.is_array() || segments.empty()) return fallback;

    double sum = 0.0;
    int n = 0;
    for (auto& seg : segments) {
        if (seg.contains("avg_logprob") && seg["avg_logprob"].is_number()) {
            sum += std::exp(seg["avg_logprob"].get<double>());
            ++n;
        }
    }
    if (n > 0) return std::clamp(sum / n, 0.0, 1.0);

    for (auto& seg : segments) {
        if (!seg.contains("tokens") || !seg["tokens"].is_array()) continue;
        for (auto& tok : seg["tokens"]) {
            if (tok.is_object() && tok.contains("p") && tok["p"].is_number()) {
                sum += tok["p"].get<double>();
                ++n;
            }
        }
    }
    if (n > 0) return std::clamp(sum / n, 0.0, 1.0);

    return fallback;
}

std::expected<EngineResult, Error> parse_server_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                            : err.contains("message") ? err["message"].get<std::string>()
                            : err.dump();
            return engine_error("server error: " + msg);
        }
        if (!j.contains("text")) {
            return engine_error("unexpected response: " + body);
        }

        EngineResult result;
        result.text = trim(j["text"].get<std::string>());
        result.confidence = confidence_from_segments(j.value("segments", json::array()), result.text);
        return result;
    } catch (const json::exception& e) {
        return engine_error(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<EngineResult, Error> parse_cli_output(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.contains("transcription") || !j["transcription"].is_array()) {
            return engine_error("whisper-cli output has no transcription array");
        }

        auto& segments = j["transcription"];
        std::string text;
        for (auto& seg : segments) {
            text += seg.value("text", "");
        }

        EngineResult result;
        result.text = trim(text);
        result.confidence = confidence_from_segments(segments, result.text);
        return result;
    } catch (const json::exception& e) {
        return engine_error(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace engine
