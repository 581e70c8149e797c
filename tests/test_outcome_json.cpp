#include <catch2/catch_test_macros.hpp>

#include "core/outcome_json.hpp"

TEST_CASE("to_json", "[outcome]") {
    TranscriptionOutcome outcome{
        .status = OutcomeStatus::Partial,
        .transcript = "xin chao",
        .duration = 61.5,
        .confidence = 0.8,
        .processing_time = 12.25,
        .chunks_processed = 3,
        .chunks_total = 3,
        .fast_path = false,
    };
    outcome.chunks.push_back({.index = 0, .start = 0.0, .end = 30.0, .text = "xin",
                              .confidence = 0.8, .status = ChunkStatus::Ok});
    outcome.chunks.push_back({.index = 1, .start = 29.0, .end = 59.0,
                              .error = Error{ErrorKind::Engine, "server error: busy"}});
    outcome.chunks.push_back({.index = 2, .start = 58.0, .end = 61.5, .text = "chao",
                              .confidence = 0.8, .status = ChunkStatus::Ok});

    SECTION("OutcomeFields") {
        auto j = to_json(outcome);
        REQUIRE(j["status"] == "partial");
        REQUIRE(j["transcript"] == "xin chao");
        REQUIRE(j["duration"].get<double>() == 61.5);
        REQUIRE(j["confidence"].get<double>() == 0.8);
        REQUIRE(j["processing_time"].get<double>() == 12.25);
        REQUIRE(j["chunks_processed"] == 3);
        REQUIRE(j["chunks_total"] == 3);
        REQUIRE(j["fast_path"] == false);
        REQUIRE_FALSE(j.contains("error"));
        REQUIRE(j["chunks"].size() == 3);
    }

    SECTION("ChunkFields") {
        auto j = to_json(outcome);
        auto& ok = j["chunks"][0];
        REQUIRE(ok["index"] == 0);
        REQUIRE(ok["status"] == "ok");
        REQUIRE(ok["text"] == "xin");
        REQUIRE_FALSE(ok.contains("error"));

        auto& failed = j["chunks"][1];
        REQUIRE(failed["status"] == "failed");
        REQUIRE(failed["start"].get<double>() == 29.0);
        REQUIRE(failed["error"]["kind"] == "engine");
        REQUIRE(failed["error"]["message"] == "server error: busy");
    }

    SECTION("ErrorIncludedWhenPresent") {
        outcome.status = OutcomeStatus::Timeout;
        outcome.error = "deadline exceeded after 2 of 3 chunks";
        auto j = to_json(outcome);
        REQUIRE(j["status"] == "timeout");
        REQUIRE(j["error"] == "deadline exceeded after 2 of 3 chunks");
    }

    SECTION("EmptyOutcome") {
        auto j = to_json(TranscriptionOutcome{});
        REQUIRE(j["status"] == "failed");
        REQUIRE(j["transcript"] == "");
        REQUIRE(j["chunks"].is_array());
        REQUIRE(j["chunks"].empty());
    }
}
