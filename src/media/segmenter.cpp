#include "media/segmenter.hpp"

#include "platform/subprocess.hpp"

#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace {

// Tolerance for windows computed from a float duration.
constexpr double kRangeEpsilon = 1e-3;

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    auto start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

FfmpegSegmenter::FfmpegSegmenter(std::string ffmpeg)
    : ffmpeg_(std::move(ffmpeg)) {}

bool FfmpegSegmenter::available() const {
    return !process::find_executable(ffmpeg_).empty();
}

std::expected<fs::path, Error>
FfmpegSegmenter::extract(const AudioSource& source, double start, double end,
                         const fs::path& out) {
    auto fail = [](ErrorKind kind, std::string msg) {
        return std::unexpected(Error{kind, std::move(msg)});
    };

    if (start < 0.0 || start >= end || end > source.duration_s + kRangeEpsilon) {
        return fail(ErrorKind::SegmentExtraction,
                    std::format("window [{:.3f}, {:.3f}) outside [0, {:.3f}]",
                                start, end, source.duration_s));
    }

    {
        std::ifstream probe(source.path, std::ios::binary);
        if (!probe.is_open()) {
            return fail(ErrorKind::SegmentExtraction,
                        "source unreadable: " + source.path.string());
        }
    }

    auto res = process::run({ffmpeg_, "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
                             "-ss", std::format("{:.3f}", start),
                             "-t", std::format("{:.3f}", end - start),
                             "-i", source.path.string(),
                             "-vn", "-ac", "1", "-ar", "16000", "-c:a", "pcm_s16le",
                             out.string()});
    if (!res) {
        return fail(ErrorKind::ExtractionUnavailable, "ffmpeg: " + res.error());
    }
    if (res->exit_code == 127) {
        return fail(ErrorKind::ExtractionUnavailable,
                    std::format("ffmpeg not available ({})", ffmpeg_));
    }
    if (!res->ok()) {
        std::error_code ec;
        fs::remove(out, ec);
        return fail(ErrorKind::SegmentExtraction,
                    std::format("ffmpeg exited with code {}: {}", res->exit_code,
                                last_line(res->err)));
    }

    std::error_code ec;
    if (!fs::exists(out, ec) || fs::file_size(out, ec) <= 44) {
        fs::remove(out, ec);
        return fail(ErrorKind::SegmentExtraction, "ffmpeg produced no audio for window");
    }
    return out;
}

SegmentFile& SegmentFile::operator=(SegmentFile&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void SegmentFile::release() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "segment: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}
