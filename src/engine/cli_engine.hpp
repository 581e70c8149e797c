#pragma once

#include "engine.hpp"

#include <string>

// Runs the whisper.cpp command line tool once per segment.
class CliEngine : public EngineAdapter {
public:
    // JSON side files are written under scratch_dir and removed after reading.
    CliEngine(std::string executable, std::string model_path, int threads,
              std::filesystem::path scratch_dir);

    std::expected<void, Error> open() override;
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    std::string name() const override { return "cli"; }

    std::expected<EngineResult, Error>
        transcribe(const std::filesystem::path& segment, const std::string& language) override;

private:
    std::string executable_;
    std::string model_path_;
    int threads_;
    std::filesystem::path scratch_dir_;
    std::string resolved_;
    unsigned long calls_ = 0;
    bool open_ = false;
};
