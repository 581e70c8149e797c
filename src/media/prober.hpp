#pragma once

#include "core/error.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

class MediaProber {
public:
    virtual ~MediaProber() = default;
    // Total duration in seconds of a local media file.
    virtual std::expected<double, Error> duration(const std::filesystem::path& file) = 0;
};

class FfprobeProber : public MediaProber {
public:
    explicit FfprobeProber(std::string ffprobe = "ffprobe");

    std::expected<double, Error> duration(const std::filesystem::path& file) override;

private:
    std::string ffprobe_;
};

namespace media {

// Container/codec extensions the pipeline accepts as input.
bool is_supported_format(const std::filesystem::path& file);

// Parses the single value printed by
// `ffprobe -show_entries format=duration -of default=nw=1:nk=1`.
std::optional<double> parse_ffprobe_duration(std::string_view output);

} // namespace media
