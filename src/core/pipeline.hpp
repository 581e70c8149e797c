#pragma once

#include "chunk_processor.hpp"
#include "config.hpp"
#include "error.hpp"
#include "timeout.hpp"
#include "types.hpp"

#include "engine/engine.hpp"
#include "media/prober.hpp"
#include "media/segmenter.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

enum class PipelineState {
    Idle,
    Probing,
    Planning,
    FastPath,
    ChunkLoop,
    Merging,
    Done,
    TimedOut,
    Failed,
};

const char* to_string(PipelineState state);

// Transcribes one local file end to end: probe, plan, segment + transcribe
// chunk by chunk (or in one pass for short clips), merge. Every failure
// after configuration validation is reported through the outcome's status.
class Pipeline {
public:
    using Clock = ChunkProcessor::Clock;
    using NowFn = ChunkProcessor::NowFn;
    using ProgressCallback = ChunkProcessor::ProgressCallback;

    Pipeline(const Config& config, MediaProber& prober, AudioSegmenter& segmenter,
             EngineAdapter& engine, bool verbose = false);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void set_clock(NowFn now);
    void set_progress_callback(ProgressCallback cb);

    // The error side carries only ConfigurationError, raised before any I/O.
    std::expected<TranscriptionOutcome, Error>
        run(const std::filesystem::path& source_file,
            const std::optional<std::string>& language_hint = std::nullopt);

    PipelineState state() const { return state_; }

private:
    TranscriptionOutcome fail(TranscriptionOutcome outcome, const Error& error,
                              Clock::time_point started);
    TranscriptionOutcome finish(TranscriptionOutcome outcome, ChunkProcessor::LoopResult loop,
                                Clock::time_point started);
    std::expected<void, Error> check_disk_space(const TempWorkspace& workspace) const;

    void transition(PipelineState next);
    void log(const std::string& msg);

    const Config& config_;
    MediaProber& prober_;
    AudioSegmenter& segmenter_;
    EngineAdapter& engine_;
    bool verbose_;

    ChunkProcessor processor_;
    NowFn now_ = [] { return Clock::now(); };
    PipelineState state_ = PipelineState::Idle;
};
