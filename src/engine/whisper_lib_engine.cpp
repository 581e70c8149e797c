#include "whisper_lib_engine.hpp"
#include "response.hpp"

#include "media/wav.hpp"

#include <chrono>
#include <format>
#include <print>
#include <vector>
#include <whisper.h>

namespace fs = std::filesystem;

WhisperLibEngine::WhisperLibEngine(std::string model_path, int threads)
    : model_path_(std::move(model_path)), threads_(threads) {}

WhisperLibEngine::~WhisperLibEngine() {
    close();
}

std::expected<void, Error> WhisperLibEngine::open() {
    if (ctx_) return {};

    std::error_code ec;
    if (model_path_.empty() || !fs::is_regular_file(model_path_, ec)) {
        return std::unexpected(Error{ErrorKind::Engine, "model not found: " + model_path_});
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected(Error{ErrorKind::Engine,
            "whisper_init_from_file_with_params failed: " + model_path_});
    }
    return {};
}

void WhisperLibEngine::close() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::expected<EngineResult, Error>
WhisperLibEngine::transcribe(const fs::path& segment, const std::string& language) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Engine, std::move(msg)});
    };

    if (!ctx_) {
        return fail("engine not open");
    }

    auto pcm = wav::read_file(segment);
    if (!pcm) {
        return fail(segment.string() + ": " + pcm.error());
    }
    if (pcm->sample_rate != wav::kEngineSampleRate || pcm->channels != 1) {
        return fail(std::format("{}: expected 16 kHz mono, got {} Hz x{}",
                                segment.string(), pcm->sample_rate, pcm->channels));
    }
    if (pcm->samples.empty()) {
        return fail(segment.string() + ": no samples");
    }

    std::vector<float> pcmf;
    pcmf.reserve(pcm->samples.size());
    for (int16_t s : pcm->samples) {
        pcmf.push_back(static_cast<float>(s) / 32768.0f);
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.language = language.empty() ? "auto" : language.c_str();
    params.translate = false;
    params.no_context = true;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    auto start = std::chrono::steady_clock::now();
    int rc = whisper_full(ctx_, params, pcmf.data(), static_cast<int>(pcmf.size()));
    double processing_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    if (rc != 0) {
        return fail(std::format("whisper_full failed with code {}", rc));
    }

    std::string text;
    double p_sum = 0.0;
    int p_count = 0;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        text += whisper_full_get_segment_text(ctx_, i);
        const int n_tokens = whisper_full_n_tokens(ctx_, i);
        for (int t = 0; t < n_tokens; ++t) {
            p_sum += whisper_full_get_token_p(ctx_, i, t);
            ++p_count;
        }
    }

    EngineResult result;
    result.text = engine::trim(text);
    result.confidence = p_count > 0 ? p_sum / p_count : (result.text.empty() ? 0.0 : 1.0);
    result.processing_s = processing_s;
    return result;
}
