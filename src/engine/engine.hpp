#pragma once

#include "core/error.hpp"

#include <expected>
#include <filesystem>
#include <string>

struct EngineResult {
    std::string text;
    double confidence = 0.0;
    double processing_s = 0.0;
};

// One loaded inference context. Opened once per worker process, reused for
// every segment of every request, closed at shutdown. Not thread-safe: the
// owner drives it from a single thread.
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual std::expected<void, Error> open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string name() const = 0;

    // `segment` is a 16 kHz mono PCM WAV file (or, on the fallback path, the
    // untouched source file). Fails with ErrorKind::Engine.
    virtual std::expected<EngineResult, Error>
        transcribe(const std::filesystem::path& segment, const std::string& language) = 0;
};
