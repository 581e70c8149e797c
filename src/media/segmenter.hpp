#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <expected>
#include <filesystem>
#include <string>

class AudioSegmenter {
public:
    virtual ~AudioSegmenter() = default;

    // False when the extraction tool itself cannot be used at all.
    virtual bool available() const = 0;

    // Writes [start, end) of the source as 16 kHz mono 16-bit PCM WAV to
    // `out`. Fails with SegmentExtraction for an unreadable source or a
    // window outside [0, duration].
    virtual std::expected<std::filesystem::path, Error>
        extract(const AudioSource& source, double start, double end,
                const std::filesystem::path& out) = 0;
};

class FfmpegSegmenter : public AudioSegmenter {
public:
    explicit FfmpegSegmenter(std::string ffmpeg = "ffmpeg");

    bool available() const override;

    std::expected<std::filesystem::path, Error>
        extract(const AudioSource& source, double start, double end,
                const std::filesystem::path& out) override;

private:
    std::string ffmpeg_;
};

// Owns one segment file on disk; the file is removed when the owner goes
// out of scope or release() is called.
class SegmentFile {
public:
    SegmentFile() = default;
    explicit SegmentFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~SegmentFile() { release(); }

    SegmentFile(const SegmentFile&) = delete;
    SegmentFile& operator=(const SegmentFile&) = delete;
    SegmentFile(SegmentFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    SegmentFile& operator=(SegmentFile&& other) noexcept;

    const std::filesystem::path& path() const { return path_; }
    void release();

private:
    std::filesystem::path path_;
};
