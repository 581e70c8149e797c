#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/merger.hpp"

#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

ChunkResult ok(int index, std::string text, double confidence) {
    return {.index = index, .text = std::move(text), .confidence = confidence,
            .status = ChunkStatus::Ok};
}

ChunkResult failed(int index) {
    return {.index = index, .status = ChunkStatus::Failed,
            .error = Error{ErrorKind::Engine, "boom"}};
}

} // namespace

TEST_CASE("merge::merge_results", "[merger]") {

    SECTION("EmptyInput") {
        auto m = merge::merge_results({});
        REQUIRE(m.text.empty());
        REQUIRE(m.confidence == 0.0);
        REQUIRE(m.ok_chunks == 0);
    }

    SECTION("ConcatenatesWithMeanConfidence") {
        std::vector<ChunkResult> r = {ok(0, "Hello world", 0.9), ok(1, "this is", 0.8)};
        auto m = merge::merge_results(r);
        REQUIRE(m.text == "Hello world this is");
        REQUIRE_THAT(m.confidence, WithinAbs(0.85, 1e-9));
        REQUIRE(m.ok_chunks == 2);
    }

    SECTION("FailedChunksOmittedSilently") {
        std::vector<ChunkResult> r = {ok(0, "one", 0.5), failed(1), ok(2, "three", 1.0)};
        auto m = merge::merge_results(r);
        REQUIRE(m.text == "one three");
        REQUIRE_THAT(m.confidence, WithinAbs(0.75, 1e-9));
        REQUIRE(m.ok_chunks == 2);
    }

    SECTION("AllFailed") {
        std::vector<ChunkResult> r = {failed(0), failed(1)};
        auto m = merge::merge_results(r);
        REQUIRE(m.text.empty());
        REQUIRE(m.confidence == 0.0);
        REQUIRE(m.ok_chunks == 0);
    }

    SECTION("OrderedByIndex") {
        std::vector<ChunkResult> r = {ok(2, "c", 1.0), ok(0, "a", 1.0), ok(1, "b", 1.0)};
        REQUIRE(merge::merge_results(r).text == "a b c");
    }

    SECTION("EmptyOkChunkCountsForConfidenceOnly") {
        std::vector<ChunkResult> r = {ok(0, "speech", 1.0), ok(1, "   ", 0.0), ok(2, "more", 1.0)};
        auto m = merge::merge_results(r);
        REQUIRE(m.text == "speech more");
        REQUIRE_THAT(m.confidence, WithinAbs(2.0 / 3.0, 1e-9));
    }

    SECTION("OverlapKeptByDefault") {
        std::vector<ChunkResult> r = {ok(0, "we went to the market", 1.0),
                                      ok(1, "the market was closed", 1.0)};
        REQUIRE(merge::merge_results(r).text == "we went to the market the market was closed");
    }

    SECTION("OverlapRemovedWhenEnabled") {
        std::vector<ChunkResult> r = {ok(0, "we went to the market", 1.0),
                                      ok(1, "The Market was closed", 1.0)};
        merge::Options opts;
        opts.dedupe_overlap = true;
        REQUIRE(merge::merge_results(r, opts).text == "we went to the market was closed");
    }

    SECTION("SingleWordRepeatIsNotTreatedAsOverlap") {
        std::vector<ChunkResult> r = {ok(0, "go go", 1.0), ok(1, "go home", 1.0)};
        merge::Options opts;
        opts.dedupe_overlap = true;
        REQUIRE(merge::merge_results(r, opts).text == "go go go home");
    }
}

TEST_CASE("merge::clean_text", "[merger]") {
    REQUIRE(merge::clean_text("  Hello   world \n") == "Hello world");
    REQUIRE(merge::clean_text("Stop!!! Really??") == "Stop! Really?");
    REQUIRE(merge::clean_text("Wait...") == "Wait.");
    REQUIRE(merge::clean_text("\t\n ").empty());
}

TEST_CASE("merge::overlap_words", "[merger]") {
    REQUIRE(merge::overlap_words("a b c d", "c d e", 2, 16) == 2);
    REQUIRE(merge::overlap_words("a b c d", "x y", 2, 16) == 0);
    REQUIRE(merge::overlap_words("a b c d", "d e", 2, 16) == 0);
    REQUIRE(merge::overlap_words("a b c d", "d e", 1, 16) == 1);
    REQUIRE(merge::overlap_words("a b c d", "b c d e", 2, 2) == 0);
}
