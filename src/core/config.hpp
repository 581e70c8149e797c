#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Chunking {
        double chunk_length_seconds = 30.0;
        double overlap_seconds = 1.0;
        bool dedupe_overlap = false;
    } chunking;

    struct Timeout {
        double base_seconds = 90.0;
        double multiplier = 1.5;
    } timeout;

    struct Engine {
        std::string type = "lan"; // "lan", "cli" or "library"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string executable = "whisper-cli";
        std::string model_path;
        std::string language = "vi";
        int max_threads = 0; // 0 = auto
        int max_threads_cap = 8;
        uint32_t request_timeout_seconds = 300;
    } engine;

    struct Media {
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        std::string temp_dir = "/tmp/chunkscribe";
        uint64_t min_free_disk_mb = 100;
    } media;

    // Upper bound for media.min_free_disk_mb; keeps the byte count in range.
    static constexpr uint64_t kMaxFreeDiskMb = uint64_t{1} << 40;

    // Thread count handed to the engine: explicit max_threads, or the
    // detected core count capped at max_threads_cap. Never below 1.
    int resolved_threads() const;

    std::expected<void, Error> validate() const;

    // Reads CHUNKSCRIBE_* overrides once; call at startup only.
    void apply_env();

    static Config load(const std::string& path);
    static Config load_default();
};
