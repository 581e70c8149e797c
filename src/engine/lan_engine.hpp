#pragma once

#include "engine.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

// Sends each segment to a whisper.cpp server or an OpenAI-compatible
// transcription endpoint.
class LanEngine : public EngineAdapter {
public:
    // api_format: "whisper.cpp" or "openai"
    LanEngine(std::string url, std::string api_format = "whisper.cpp",
              uint32_t request_timeout_s = 300);
    ~LanEngine() override;

    std::expected<void, Error> open() override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string name() const override { return "lan"; }

    std::expected<EngineResult, Error>
        transcribe(const std::filesystem::path& segment, const std::string& language) override;

private:
    std::string url_;
    std::string api_format_;
    uint32_t request_timeout_s_;
    bool open_ = false;
};

namespace engine {

// Content type sent with an uploaded file, chosen from its extension.
// nullptr when the extension is not a known audio/video container.
const char* upload_mime_type(const std::filesystem::path& file);

} // namespace engine
