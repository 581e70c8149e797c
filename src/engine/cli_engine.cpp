#include "cli_engine.hpp"
#include "response.hpp"

#include "platform/subprocess.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;

CliEngine::CliEngine(std::string executable, std::string model_path, int threads,
                     fs::path scratch_dir)
    : executable_(std::move(executable)), model_path_(std::move(model_path)),
      threads_(threads), scratch_dir_(std::move(scratch_dir)) {}

std::expected<void, Error> CliEngine::open() {
    resolved_ = process::find_executable(executable_);
    if (resolved_.empty()) {
        return std::unexpected(Error{ErrorKind::Engine, "executable not found: " + executable_});
    }
    std::error_code ec;
    if (model_path_.empty() || !fs::is_regular_file(model_path_, ec)) {
        return std::unexpected(Error{ErrorKind::Engine, "model not found: " + model_path_});
    }
    fs::create_directories(scratch_dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Engine,
            "cannot create " + scratch_dir_.string() + ": " + ec.message()});
    }
    open_ = true;
    return {};
}

std::expected<EngineResult, Error>
CliEngine::transcribe(const fs::path& segment, const std::string& language) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Engine, std::move(msg)});
    };

    if (!open_) {
        return fail("engine not open");
    }

    // whisper-cli appends ".json" to the -of prefix.
    auto prefix = scratch_dir_ / std::format("whisper-cli-{}-{}", ::getpid(), ++calls_);
    auto json_path = fs::path(prefix.string() + ".json");

    auto start = std::chrono::steady_clock::now();
    auto res = process::run({resolved_, "-m", model_path_, "-f", segment.string(),
                             "-l", language.empty() ? "auto" : language,
                             "-t", std::to_string(threads_),
                             "-nt", "-np", "-ojf", "-of", prefix.string()});
    double processing_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    std::string body;
    {
        std::ifstream f(json_path);
        if (f.is_open()) {
            body.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
        }
    }
    std::error_code ec;
    fs::remove(json_path, ec);

    if (!res) {
        return fail("whisper-cli: " + res.error());
    }
    if (!res->ok()) {
        return fail(std::format("whisper-cli exited with code {}: {}", res->exit_code,
                                engine::trim(res->err)));
    }
    if (body.empty()) {
        return fail("whisper-cli wrote no output for " + segment.string());
    }

    auto parsed = engine::parse_cli_output(body);
    if (!parsed) return std::unexpected(parsed.error());

    parsed->processing_s = processing_s;
    return parsed;
}
