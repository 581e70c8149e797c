#pragma once

#include "timeout.hpp"
#include "types.hpp"

#include "engine/engine.hpp"
#include "media/segmenter.hpp"
#include "media/workspace.hpp"

#include <functional>
#include <span>
#include <vector>

enum class ChunkState { Idle, Segmenting, Transcribing, Collected, Cleanup };

// Drives the segmenter and the engine over the planned windows strictly one
// at a time. A window's segment file is deleted before the next window
// starts, whatever that window's outcome was.
class ChunkProcessor {
public:
    using Clock = timeout::Budget::Clock;
    using NowFn = std::function<Clock::time_point()>;
    using ProgressCallback = std::function<void(int chunks_processed, int chunks_total,
                                                const ChunkResult& result)>;

    struct LoopResult {
        std::vector<ChunkResult> results; // one per window, in window order
        int chunks_processed = 0;
        bool timed_out = false;
        bool extraction_unavailable = false;
    };

    ChunkProcessor(AudioSegmenter& segmenter, EngineAdapter& engine, bool verbose = false);

    void set_clock(NowFn now) { now_ = std::move(now); }
    void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }

    // Segments and transcribes every window. Returns with
    // extraction_unavailable set (and no results) when the segmenter cannot
    // be used at all; the caller decides how to fall back.
    LoopResult process(const AudioSource& source, std::span<const ChunkWindow> windows,
                       const std::string& language, const TempWorkspace& workspace,
                       const timeout::Budget& budget);

    // Transcribes the source file as-is as a single window [0, duration].
    LoopResult process_direct(const AudioSource& source, const std::string& language,
                              const timeout::Budget& budget);

    ChunkState state() const { return state_; }

private:
    ChunkResult process_window(const AudioSource& source, const ChunkWindow& window,
                               const std::string& language, const TempWorkspace& workspace);
    ChunkResult transcribe_file(const std::filesystem::path& file, const ChunkWindow& window,
                                const std::string& language);
    void finish_window(LoopResult& loop, ChunkResult result, int total);

    void log(const std::string& msg);

    AudioSegmenter& segmenter_;
    EngineAdapter& engine_;
    bool verbose_;
    NowFn now_ = [] { return Clock::now(); };
    ProgressCallback progress_;
    ChunkState state_ = ChunkState::Idle;
};
