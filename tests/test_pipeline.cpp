#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/pipeline.hpp"
#include "mocks.hpp"

#include <string>

namespace {

Config test_config(const fs::path& temp_dir) {
    Config cfg;
    cfg.media.temp_dir = temp_dir.string();
    cfg.media.min_free_disk_mb = 0;
    return cfg;
}

} // namespace

TEST_CASE("Pipeline end to end", "[pipeline]") {
    TmpDir temp("pipeline");
    Config cfg = test_config(temp.path);
    FakeClock clock;
    MockSegmenter segmenter;
    MockEngine engine;

    SECTION("ShortClipTakesFastPath") {
        MockProber prober(25.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/short.wav");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Success);
        REQUIRE(out->fast_path);
        REQUIRE(out->chunks_total == 1);
        REQUIRE(out->chunks_processed == 1);
        REQUIRE(out->transcript == "part 0");
        REQUIRE(out->duration == 25.0);
        REQUIRE(engine.inputs.size() == 1);
        REQUIRE(pipeline.state() == PipelineState::Done);
    }

    SECTION("LongClipIsChunked") {
        MockProber prober(278.65);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/lecture.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Success);
        REQUIRE_FALSE(out->fast_path);
        REQUIRE(out->chunks_total == 10);
        REQUIRE(out->chunks_processed == 10);
        REQUIRE(out->transcript ==
                "part 0 part 1 part 2 part 3 part 4 part 5 part 6 part 7 part 8 part 9");
        REQUIRE(out->confidence == Catch::Approx(0.9));
        REQUIRE(out->chunks.size() == 10);
        REQUIRE_FALSE(out->error.has_value());
    }

    SECTION("SegmentsAndWorkspaceCleanedUp") {
        MockProber prober(278.65);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/lecture.mp3");
        REQUIRE(out.has_value());
        REQUIRE(segmenter.max_segments_on_disk == 0);
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("FailedChunkGivesPartial") {
        MockProber prober(278.65);
        engine.fail_calls = {4};
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/lecture.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Partial);
        REQUIRE(out->chunks_processed == 10);
        REQUIRE(out->transcript.find("part 4") == std::string::npos);
        REQUIRE(out->transcript.find("part 3 part 5") != std::string::npos);
        REQUIRE_FALSE(out->chunks[4].ok());
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("AllChunksFailedGivesFailed") {
        MockProber prober(100.0);
        engine.fail_calls = {0, 1, 2, 3};
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Failed);
        REQUIRE(out->transcript.empty());
        REQUIRE(out->confidence == 0.0);
        REQUIRE(out->error == "engine failed on call 0");
        REQUIRE(pipeline.state() == PipelineState::Failed);
    }

    SECTION("DeadlineStopsChunkLoop") {
        // Deadline max(1, 100 * 0.01) = 1s; each chunk takes 0.6s.
        cfg.timeout.base_seconds = 1.0;
        cfg.timeout.multiplier = 0.01;
        MockProber prober(100.0);
        engine.clock = &clock;
        engine.seconds_per_call = 0.6;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Timeout);
        REQUIRE(out->chunks_processed == 2);
        REQUIRE(out->chunks_total == 4);
        REQUIRE(out->transcript == "part 0 part 1");
        REQUIRE(out->chunks[2].error->kind == ErrorKind::Timeout);
        REQUIRE(out->chunks[3].error->kind == ErrorKind::Timeout);
        REQUIRE(out->error.has_value());
        REQUIRE(engine.inputs.size() == 2);
        REQUIRE(pipeline.state() == PipelineState::TimedOut);
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("FastPathOverrunIsTimeout") {
        // Deadline max(90, 25 * 1.5) = 90s; the single pass takes 500s.
        MockProber prober(25.0);
        engine.clock = &clock;
        engine.seconds_per_call = 500.0;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/short.wav");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Timeout);
        REQUIRE(out->fast_path);
        REQUIRE(out->chunks_processed == 1);
        REQUIRE(out->chunks_total == 1);
        REQUIRE(out->transcript == "part 0");
        REQUIRE(out->processing_time == Catch::Approx(500.0));
        REQUIRE(out->error.has_value());
        REQUIRE(pipeline.state() == PipelineState::TimedOut);
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("LastChunkOverrunIsTimeout") {
        // Deadline max(350, 100 * 0.01) = 350s; every chunk starts before it,
        // the fourth one finishes at 400s.
        cfg.timeout.base_seconds = 350.0;
        cfg.timeout.multiplier = 0.01;
        MockProber prober(100.0);
        engine.clock = &clock;
        engine.seconds_per_call = 100.0;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Timeout);
        REQUIRE(out->chunks_processed == 4);
        REQUIRE(out->chunks_total == 4);
        REQUIRE(out->transcript == "part 0 part 1 part 2 part 3");
        for (auto& c : out->chunks) REQUIRE(c.ok());
        REQUIRE(pipeline.state() == PipelineState::TimedOut);
    }

    SECTION("FinishingBeforeDeadlineIsSuccess") {
        cfg.timeout.base_seconds = 350.0;
        cfg.timeout.multiplier = 0.01;
        MockProber prober(100.0);
        engine.clock = &clock;
        engine.seconds_per_call = 80.0;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Success);
        REQUIRE(out->processing_time == Catch::Approx(320.0));
    }

    SECTION("CreatedTempBaseIsRemoved") {
        auto base = temp.path / "not_yet";
        cfg.media.temp_dir = base.string();
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Success);
        REQUIRE_FALSE(fs::exists(base));
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("ExtractionUnavailableFallsBackToSinglePass") {
        MockProber prober(100.0);
        segmenter.is_available = false;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Success);
        REQUIRE(out->fast_path);
        REQUIRE(out->chunks_total == 1);
        REQUIRE(engine.inputs.size() == 1);
        REQUIRE(engine.inputs[0].string() == "/data/clip.mp3");
        REQUIRE(segmenter.windows.empty());
    }

    SECTION("ProbeFailureFailsWithoutTranscribing") {
        MockProber prober(100.0);
        prober.fail = true;
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/broken.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Failed);
        REQUIRE(out->error == "probe failed");
        REQUIRE(engine.inputs.empty());
        REQUIRE(segmenter.windows.empty());
    }

    SECTION("InsufficientDiskSpaceFails") {
        cfg.media.min_free_disk_mb = 1'000'000'000'000ULL;
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(out->status == OutcomeStatus::Failed);
        REQUIRE(out->error->find("insufficient disk space") != std::string::npos);
        REQUIRE(engine.inputs.empty());
        REQUIRE(temp.entry_count() == 0);
    }

    SECTION("InvalidConfigRejectedBeforeProbing") {
        cfg.chunking.overlap_seconds = 30.0;
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::Configuration);
        REQUIRE(prober.calls == 0);
    }

    SECTION("LanguageHintOverridesConfig") {
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3", "en");
        REQUIRE(out.has_value());
        REQUIRE(engine.languages == std::vector<std::string>(4, "en"));

        engine.languages.clear();
        auto again = pipeline.run("/data/clip.mp3");
        REQUIRE(again.has_value());
        REQUIRE(engine.languages == std::vector<std::string>(4, "vi"));
    }

    SECTION("ProgressCallbackSeesEveryChunk") {
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());
        int calls = 0;
        int last_total = 0;
        pipeline.set_progress_callback([&](int done, int total, const ChunkResult&) {
            ++calls;
            REQUIRE(done == calls);
            last_total = total;
        });

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        REQUIRE(calls == 4);
        REQUIRE(last_total == 4);
    }

    SECTION("DedupeRemovesRepeatedOverlapWords") {
        cfg.chunking.dedupe_overlap = true;
        MockProber prober(100.0);
        Pipeline pipeline(cfg, prober, segmenter, engine);
        pipeline.set_clock(clock.fn());

        auto out = pipeline.run("/data/clip.mp3");
        REQUIRE(out.has_value());
        // "part N" tails and heads share only one word, below the minimum.
        REQUIRE(out->transcript == "part 0 part 1 part 2 part 3");
    }
}
