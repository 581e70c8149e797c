#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// 16-bit PCM WAV encoding and decoding, the segment format exchanged
// between the segmenter and the engines.
namespace wav {

inline constexpr uint32_t kEngineSampleRate = 16000;

struct Pcm {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::vector<int16_t> samples; // interleaved

    double duration_s() const {
        if (sample_rate == 0 || channels == 0) return 0.0;
        return static_cast<double>(samples.size()) / channels / sample_rate;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Walks the RIFF chunk list; only uncompressed 16-bit PCM is accepted.
inline std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* t) {
        return std::memcmp(bytes.data() + pos, t, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Pcm pcm;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + size > bytes.size()) {
            // Streams written by pipes often leave the data size unset.
            size = static_cast<uint32_t>(bytes.size() - body);
        }

        if (tag(pos, "fmt ")) {
            if (size < 16) return std::unexpected("truncated fmt chunk");
            uint16_t format = r16(body);
            pcm.channels = r16(body + 2);
            pcm.sample_rate = r32(body + 4);
            uint16_t bits = r16(body + 14);
            if (format != 1 || bits != 16) {
                return std::unexpected("unsupported WAV encoding (need 16-bit PCM)");
            }
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            pcm.samples.resize(size / sizeof(int16_t));
            std::memcpy(pcm.samples.data(), bytes.data() + body,
                        pcm.samples.size() * sizeof(int16_t));
            return pcm;
        }

        pos = body + size + (size & 1);
    }
    return std::unexpected("no data chunk");
}

inline std::expected<Pcm, std::string> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    return decode(bytes);
}

inline bool write_file(const std::filesystem::path& path, std::span<const int16_t> samples,
                       uint32_t sample_rate, uint16_t channels = 1) {
    auto bytes = encode(samples, sample_rate, channels);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return false;
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(f);
}

} // namespace wav
