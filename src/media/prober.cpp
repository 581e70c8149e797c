#include "media/prober.hpp"

#include "platform/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>

namespace fs = std::filesystem;

namespace media {

bool is_supported_format(const fs::path& file) {
    static constexpr std::array<std::string_view, 12> kFormats = {
        ".mp3", ".wav", ".m4a", ".mp4", ".aac", ".ogg",
        ".flac", ".wma", ".webm", ".mkv", ".avi", ".mov",
    };
    auto ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kFormats.begin(), kFormats.end(), ext) != kFormats.end();
}

std::optional<double> parse_ffprobe_duration(std::string_view output) {
    auto first = output.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return std::nullopt;
    auto last = output.find_first_of(" \t\r\n", first);
    auto token = output.substr(first, last == std::string_view::npos ? last : last - first);

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    if (!std::isfinite(value) || value <= 0.0) return std::nullopt;
    return value;
}

} // namespace media

FfprobeProber::FfprobeProber(std::string ffprobe)
    : ffprobe_(std::move(ffprobe)) {}

std::expected<double, Error> FfprobeProber::duration(const fs::path& file) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Probe, std::move(msg)});
    };

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return fail("audio file not found: " + file.string());
    }
    if (!media::is_supported_format(file)) {
        return fail("unsupported audio format: " + file.extension().string());
    }

    auto res = process::run({ffprobe_, "-v", "error",
                             "-show_entries", "format=duration",
                             "-of", "default=noprint_wrappers=1:nokey=1",
                             file.string()});
    if (!res) {
        return fail("ffprobe: " + res.error());
    }
    if (res->exit_code == 127) {
        return fail(std::format("ffprobe not available ({})", ffprobe_));
    }
    if (!res->ok()) {
        return fail(std::format("ffprobe exited with code {}: {}", res->exit_code, res->err));
    }

    auto d = media::parse_ffprobe_duration(res->out);
    if (!d) {
        return fail("could not determine duration of " + file.string());
    }
    return *d;
}
