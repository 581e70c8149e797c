#pragma once

#include "engine.hpp"

#include <string>

struct whisper_context;

// In-process whisper.cpp context. The model is loaded by open() and kept
// until close(); every segment reuses the same context.
class WhisperLibEngine : public EngineAdapter {
public:
    WhisperLibEngine(std::string model_path, int threads);
    ~WhisperLibEngine() override;

    WhisperLibEngine(const WhisperLibEngine&) = delete;
    WhisperLibEngine& operator=(const WhisperLibEngine&) = delete;

    std::expected<void, Error> open() override;
    void close() override;
    bool is_open() const override { return ctx_ != nullptr; }
    std::string name() const override { return "library"; }

    std::expected<EngineResult, Error>
        transcribe(const std::filesystem::path& segment, const std::string& language) override;

private:
    std::string model_path_;
    int threads_;
    whisper_context* ctx_ = nullptr;
};
