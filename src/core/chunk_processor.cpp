#include "chunk_processor.hpp"

#include <format>
#include <print>

ChunkProcessor::ChunkProcessor(AudioSegmenter& segmenter, EngineAdapter& engine, bool verbose)
    : segmenter_(segmenter), engine_(engine), verbose_(verbose) {}

ChunkProcessor::LoopResult
ChunkProcessor::process(const AudioSource& source, std::span<const ChunkWindow> windows,
                        const std::string& language, const TempWorkspace& workspace,
                        const timeout::Budget& budget) {
    LoopResult loop;

    if (!segmenter_.available()) {
        loop.extraction_unavailable = true;
        return loop;
    }

    const int total = static_cast<int>(windows.size());
    loop.results.reserve(windows.size());

    for (const auto& window : windows) {
        if (loop.timed_out || budget.expired(now_())) {
            if (!loop.timed_out) {
                log(std::format("Deadline of {:.1f}s reached before chunk {}/{}",
                                budget.deadline(), window.index + 1, total));
            }
            loop.timed_out = true;
            loop.results.push_back({
                .index = window.index,
                .start = window.start,
                .end = window.end,
                .status = ChunkStatus::Failed,
                .error = Error{ErrorKind::Timeout, "not started before deadline"},
            });
            continue;
        }

        finish_window(loop, process_window(source, window, language, workspace), total);
    }

    state_ = ChunkState::Idle;
    return loop;
}

ChunkProcessor::LoopResult
ChunkProcessor::process_direct(const AudioSource& source, const std::string& language,
                               const timeout::Budget& budget) {
    LoopResult loop;
    ChunkWindow whole{.index = 0, .start = 0.0, .end = source.duration_s};

    if (budget.expired(now_())) {
        loop.timed_out = true;
        loop.results.push_back({
            .index = 0,
            .start = whole.start,
            .end = whole.end,
            .status = ChunkStatus::Failed,
            .error = Error{ErrorKind::Timeout, "not started before deadline"},
        });
        return loop;
    }

    finish_window(loop, transcribe_file(source.path, whole, language), 1);
    state_ = ChunkState::Idle;
    return loop;
}

ChunkResult ChunkProcessor::process_window(const AudioSource& source, const ChunkWindow& window,
                                           const std::string& language,
                                           const TempWorkspace& workspace) {
    state_ = ChunkState::Segmenting;

    // Owns the path before extraction so partial output is removed too.
    SegmentFile segment(workspace.file(std::format("chunk_{:04d}.wav", window.index)));

    auto extracted = segmenter_.extract(source, window.start, window.end, segment.path());
    if (!extracted) {
        std::println(stderr, "processor: chunk {} [{:.2f}s-{:.2f}s] extraction failed: {}",
                     window.index, window.start, window.end, extracted.error().message);
        state_ = ChunkState::Cleanup;
        return {
            .index = window.index,
            .start = window.start,
            .end = window.end,
            .status = ChunkStatus::Failed,
            .error = extracted.error(),
        };
    }

    auto result = transcribe_file(*extracted, window, language);

    state_ = ChunkState::Cleanup;
    segment.release();
    return result;
}

ChunkResult ChunkProcessor::transcribe_file(const std::filesystem::path& file,
                                            const ChunkWindow& window,
                                            const std::string& language) {
    state_ = ChunkState::Transcribing;
    auto res = engine_.transcribe(file, language);
    state_ = ChunkState::Collected;

    if (!res) {
        std::println(stderr, "processor: chunk {} [{:.2f}s-{:.2f}s] transcription failed: {}",
                     window.index, window.start, window.end, res.error().message);
        return {
            .index = window.index,
            .start = window.start,
            .end = window.end,
            .status = ChunkStatus::Failed,
            .error = res.error(),
        };
    }

    return {
        .index = window.index,
        .start = window.start,
        .end = window.end,
        .text = std::move(res->text),
        .confidence = res->confidence,
        .status = ChunkStatus::Ok,
    };
}

void ChunkProcessor::finish_window(LoopResult& loop, ChunkResult result, int total) {
    ++loop.chunks_processed;
    log(std::format("Chunk {}/{} [{:.2f}s-{:.2f}s] {} ({} chars, confidence {:.2f})",
                    loop.chunks_processed, total, result.start, result.end,
                    result.ok() ? "ok" : "failed", result.text.size(), result.confidence));
    loop.results.push_back(std::move(result));
    if (progress_) {
        progress_(loop.chunks_processed, total, loop.results.back());
    }
}

void ChunkProcessor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[chunkscribe] {}", msg);
    }
}
