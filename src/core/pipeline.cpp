#include "pipeline.hpp"

#include "chunk_planner.hpp"
#include "merger.hpp"

#include "media/wav.hpp"

#include <cmath>
#include <format>
#include <print>

namespace fs = std::filesystem;

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "idle";
        case PipelineState::Probing: return "probing";
        case PipelineState::Planning: return "planning";
        case PipelineState::FastPath: return "fast_path";
        case PipelineState::ChunkLoop: return "chunk_loop";
        case PipelineState::Merging: return "merging";
        case PipelineState::Done: return "done";
        case PipelineState::TimedOut: return "timed_out";
        case PipelineState::Failed: return "failed";
    }
    return "unknown";
}

Pipeline::Pipeline(const Config& config, MediaProber& prober, AudioSegmenter& segmenter,
                   EngineAdapter& engine, bool verbose)
    : config_(config), prober_(prober), segmenter_(segmenter), engine_(engine),
      verbose_(verbose), processor_(segmenter_, engine_, verbose) {}

void Pipeline::set_clock(NowFn now) {
    now_ = now;
    processor_.set_clock(std::move(now));
}

void Pipeline::set_progress_callback(ProgressCallback cb) {
    processor_.set_progress_callback(std::move(cb));
}

std::expected<TranscriptionOutcome, Error>
Pipeline::run(const fs::path& source_file, const std::optional<std::string>& language_hint) {
    state_ = PipelineState::Idle;
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    auto started = now_();
    TranscriptionOutcome outcome;

    transition(PipelineState::Probing);
    auto duration = prober_.duration(source_file);
    if (!duration) {
        return fail(std::move(outcome), duration.error(), started);
    }

    const AudioSource source{
        .path = source_file,
        .duration_s = *duration,
        .language = language_hint.value_or(config_.engine.language),
    };
    outcome.duration = source.duration_s;

    timeout::Budget budget(started, timeout::compute(source.duration_s,
                                                     config_.timeout.base_seconds,
                                                     config_.timeout.multiplier));
    log(std::format("{}: {:.2f}s audio, language {}, deadline {:.1f}s",
                    source.path.string(), source.duration_s,
                    source.language.empty() ? "auto" : source.language, budget.deadline()));

    transition(PipelineState::Planning);
    auto windows = chunking::plan(source.duration_s, config_.chunking.chunk_length_seconds,
                                  config_.chunking.overlap_seconds);
    if (!windows) {
        return fail(std::move(outcome), windows.error(), started);
    }
    outcome.chunks_total = static_cast<int>(windows->size());

    auto workspace = TempWorkspace::create(config_.media.temp_dir);
    if (!workspace) {
        return fail(std::move(outcome), workspace.error(), started);
    }

    ChunkProcessor::LoopResult loop;
    if (windows->size() == 1) {
        transition(PipelineState::FastPath);
        outcome.fast_path = true;
        loop = segmenter_.available()
            ? processor_.process(source, *windows, source.language, *workspace, budget)
            : processor_.process_direct(source, source.language, budget);
    } else {
        if (auto space = check_disk_space(*workspace); !space) {
            return fail(std::move(outcome), space.error(), started);
        }

        transition(PipelineState::ChunkLoop);
        log(std::format("Chunking into {} windows of {:.1f}s (overlap {:.1f}s)",
                        windows->size(), config_.chunking.chunk_length_seconds,
                        config_.chunking.overlap_seconds));
        loop = processor_.process(source, *windows, source.language, *workspace, budget);

        if (loop.extraction_unavailable) {
            std::println(stderr, "pipeline: audio extraction unavailable, "
                                 "falling back to single-pass transcription");
            transition(PipelineState::FastPath);
            outcome.fast_path = true;
            loop = processor_.process_direct(source, source.language, budget);
        }
    }

    // A single pass or the last chunk may run past the deadline without a
    // later window noticing it.
    if (!loop.timed_out && budget.expired(now_())) {
        log(std::format("Deadline of {:.1f}s passed during the last transcription",
                        budget.deadline()));
        loop.timed_out = true;
    }

    return finish(std::move(outcome), std::move(loop), started);
}

TranscriptionOutcome Pipeline::finish(TranscriptionOutcome outcome,
                                      ChunkProcessor::LoopResult loop,
                                      Clock::time_point started) {
    transition(PipelineState::Merging);

    merge::Options opts;
    opts.dedupe_overlap = config_.chunking.dedupe_overlap;
    auto merged = merge::merge_results(loop.results, opts);

    outcome.transcript = std::move(merged.text);
    outcome.confidence = merged.confidence;
    outcome.chunks_processed = loop.chunks_processed;
    outcome.chunks_total = static_cast<int>(loop.results.size());

    int failed = outcome.chunks_total - merged.ok_chunks;
    if (loop.timed_out) {
        outcome.status = OutcomeStatus::Timeout;
        outcome.error = std::format("deadline exceeded after {} of {} chunks",
                                    outcome.chunks_processed, outcome.chunks_total);
        transition(PipelineState::TimedOut);
    } else if (merged.ok_chunks == 0) {
        outcome.status = OutcomeStatus::Failed;
        for (auto& r : loop.results) {
            if (r.error) {
                outcome.error = r.error->message;
                break;
            }
        }
        transition(PipelineState::Failed);
    } else if (failed > 0) {
        outcome.status = OutcomeStatus::Partial;
        transition(PipelineState::Done);
    } else {
        outcome.status = OutcomeStatus::Success;
        transition(PipelineState::Done);
    }

    outcome.chunks = std::move(loop.results);
    outcome.processing_time = std::chrono::duration<double>(now_() - started).count();

    log(std::format("Finished: {} ({}/{} chunks, {} failed, {:.2f}s, {} chars, confidence {:.2f})",
                    to_string(outcome.status), outcome.chunks_processed, outcome.chunks_total,
                    failed, outcome.processing_time, outcome.transcript.size(),
                    outcome.confidence));
    return outcome;
}

TranscriptionOutcome Pipeline::fail(TranscriptionOutcome outcome, const Error& error,
                                    Clock::time_point started) {
    std::println(stderr, "pipeline: {} error: {}", ::to_string(error.kind), error.message);
    outcome.status = OutcomeStatus::Failed;
    outcome.error = error.message;
    outcome.processing_time = std::chrono::duration<double>(now_() - started).count();
    transition(PipelineState::Failed);
    return outcome;
}

std::expected<void, Error> Pipeline::check_disk_space(const TempWorkspace& workspace) const {
    auto available = workspace.available_bytes();
    if (!available) return std::unexpected(available.error());

    // One segment at a time: 16-bit mono PCM for the longest window.
    uint64_t segment_bytes = 44 + static_cast<uint64_t>(
        std::ceil(config_.chunking.chunk_length_seconds * wav::kEngineSampleRate)) * sizeof(int16_t);
    uint64_t required = config_.media.min_free_disk_mb * 1024 * 1024 + segment_bytes;

    if (*available < required) {
        return std::unexpected(Error{ErrorKind::DiskSpace,
            std::format("insufficient disk space in {}: {} MB available, {} MB required",
                        workspace.path().string(), *available / (1024 * 1024),
                        (required + 1024 * 1024 - 1) / (1024 * 1024))});
    }
    return {};
}

void Pipeline::transition(PipelineState next) {
    if (verbose_ && next != state_) {
        std::println(stderr, "[chunkscribe] state {} -> {}", to_string(state_), to_string(next));
    }
    state_ = next;
}

void Pipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[chunkscribe] {}", msg);
    }
}
