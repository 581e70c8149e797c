#include "config.hpp"

#include "platform/paths.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

int Config::resolved_threads() const {
    if (engine.max_threads > 0) return engine.max_threads;
    int detected = static_cast<int>(std::thread::hardware_concurrency());
    if (detected <= 0) detected = 1;
    return std::max(1, std::min(detected, engine.max_threads_cap));
}

std::expected<void, Error> Config::validate() const {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Configuration, std::move(msg)});
    };

    if (chunking.chunk_length_seconds <= 0.0)
        return fail(std::format("chunk_length_seconds must be positive, got {}",
                                chunking.chunk_length_seconds));
    if (chunking.overlap_seconds < 0.0)
        return fail(std::format("overlap_seconds must not be negative, got {}",
                                chunking.overlap_seconds));
    if (chunking.overlap_seconds >= chunking.chunk_length_seconds)
        return fail(std::format("overlap_seconds ({}) must be less than chunk_length_seconds ({})",
                                chunking.overlap_seconds, chunking.chunk_length_seconds));
    if (timeout.base_seconds <= 0.0)
        return fail(std::format("timeout base_seconds must be positive, got {}",
                                timeout.base_seconds));
    if (timeout.multiplier <= 0.0)
        return fail(std::format("timeout multiplier must be positive, got {}",
                                timeout.multiplier));
    if (engine.max_threads < 0)
        return fail(std::format("max_threads must not be negative, got {}", engine.max_threads));
    if (engine.max_threads_cap < 1)
        return fail(std::format("max_threads_cap must be at least 1, got {}",
                                engine.max_threads_cap));
    if (media.min_free_disk_mb > kMaxFreeDiskMb)
        return fail(std::format("min_free_disk_mb must not exceed {}, got {}",
                                kMaxFreeDiskMb, media.min_free_disk_mb));
    if (engine.type != "lan" && engine.type != "cli" && engine.type != "library")
        return fail("unknown engine type: " + engine.type);

    return {};
}

void Config::apply_env() {
    auto env = [](const char* name) -> const char* {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    };

    if (auto v = env("CHUNKSCRIBE_ENGINE")) engine.type = v;
    if (auto v = env("CHUNKSCRIBE_ENGINE_URL")) engine.url = v;
    if (auto v = env("CHUNKSCRIBE_MODEL")) engine.model_path = v;
    if (auto v = env("CHUNKSCRIBE_LANGUAGE")) engine.language = v;
    if (auto v = env("CHUNKSCRIBE_TEMP_DIR")) media.temp_dir = v;
    if (auto v = env("CHUNKSCRIBE_MAX_THREADS")) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (end && *end == '\0' && n >= 0) {
            engine.max_threads = static_cast<int>(n);
        } else {
            std::println(stderr, "config: ignoring invalid CHUNKSCRIBE_MAX_THREADS={}", v);
        }
    }
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("chunking")) {
            auto& c = j["chunking"];
            if (c.contains("chunk_length_seconds"))
                cfg.chunking.chunk_length_seconds = c["chunk_length_seconds"].get<double>();
            if (c.contains("overlap_seconds"))
                cfg.chunking.overlap_seconds = c["overlap_seconds"].get<double>();
            if (c.contains("dedupe_overlap"))
                cfg.chunking.dedupe_overlap = c["dedupe_overlap"].get<bool>();
        }

        if (j.contains("timeout")) {
            auto& t = j["timeout"];
            if (t.contains("base_seconds")) cfg.timeout.base_seconds = t["base_seconds"].get<double>();
            if (t.contains("multiplier")) cfg.timeout.multiplier = t["multiplier"].get<double>();
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("type")) cfg.engine.type = e["type"].get<std::string>();
            if (e.contains("url")) cfg.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) cfg.engine.api_format = e["api_format"].get<std::string>();
            if (e.contains("executable")) cfg.engine.executable = e["executable"].get<std::string>();
            if (e.contains("model_path")) cfg.engine.model_path = e["model_path"].get<std::string>();
            if (e.contains("language")) cfg.engine.language = e["language"].get<std::string>();
            if (e.contains("max_threads")) cfg.engine.max_threads = e["max_threads"].get<int>();
            if (e.contains("max_threads_cap")) cfg.engine.max_threads_cap = e["max_threads_cap"].get<int>();
            if (e.contains("request_timeout_seconds"))
                cfg.engine.request_timeout_seconds = e["request_timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("media")) {
            auto& m = j["media"];
            if (m.contains("ffmpeg")) cfg.media.ffmpeg = m["ffmpeg"].get<std::string>();
            if (m.contains("ffprobe")) cfg.media.ffprobe = m["ffprobe"].get<std::string>();
            if (m.contains("temp_dir")) cfg.media.temp_dir = m["temp_dir"].get<std::string>();
            if (m.contains("min_free_disk_mb"))
                cfg.media.min_free_disk_mb = m["min_free_disk_mb"].get<uint64_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
