#include "core/config.hpp"
#include "core/outcome_json.hpp"
#include "core/pipeline.hpp"
#include "engine/engine_factory.hpp"
#include "media/prober.hpp"
#include "media/segmenter.hpp"

#include <optional>
#include <print>
#include <string>
#include <vector>

static void print_usage() {
    std::println("Usage: chunkscribe [options] FILE...");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -l, --language LANG Language hint for every file");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::optional<std::string> language;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--language" || arg == "-l") {
            if (i + 1 < argc) language = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 2;
        } else {
            files.push_back(std::move(arg));
        }
    }

    if (files.empty()) {
        print_usage();
        return 2;
    }

    // Resolved once; everything below receives it by reference.
    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "Invalid configuration: {}", valid.error().message);
        return 2;
    }

    auto engine = make_engine(config);
    if (!engine) {
        std::println(stderr, "Failed to create engine: {}", engine.error().message);
        return 2;
    }
    if (auto opened = (*engine)->open(); !opened) {
        std::println(stderr, "Failed to open {} engine: {}", (*engine)->name(),
                     opened.error().message);
        return 2;
    }

    if (verbose) {
        std::println(stderr, "[chunkscribe] Engine {} ready ({} threads)", (*engine)->name(),
                     config.resolved_threads());
    }

    FfprobeProber prober(config.media.ffprobe);
    FfmpegSegmenter segmenter(config.media.ffmpeg);
    Pipeline pipeline(config, prober, segmenter, **engine, verbose);

    if (verbose) {
        pipeline.set_progress_callback([](int processed, int total, const ChunkResult& r) {
            std::println(stderr, "[chunkscribe] progress {}/{} (chunk {} {})", processed, total,
                         r.index, r.ok() ? "ok" : "failed");
        });
    }

    int exit_code = 0;
    for (const auto& file : files) {
        auto outcome = pipeline.run(file, language);
        if (!outcome) {
            std::println(stderr, "Invalid configuration: {}", outcome.error().message);
            exit_code = 2;
            break;
        }

        auto j = to_json(*outcome);
        j["file"] = file;
        std::println("{}", j.dump());

        if (outcome->status != OutcomeStatus::Success && outcome->status != OutcomeStatus::Partial) {
            exit_code = 1;
        }
    }

    (*engine)->close();
    return exit_code;
}
