#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

// RIFF/WAVE helpers for 16-bit PCM recordings.
namespace wav {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;
constexpr size_t HEADER_SIZE = 44;

struct Info {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    double duration_s() const {
        size_t frame_bytes = static_cast<size_t>(channels) * (bits_per_sample / 8);
        if (sample_rate == 0 || frame_bytes == 0) return 0.0;
        return static_cast<double>(data_size / frame_bytes) / sample_rate;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(HEADER_SIZE + data_size);
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
    w32(16);
    w16(FORMAT_PCM);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + HEADER_SIZE, samples.data(), data_size);
    }

    return out;
}

// Walks the chunk list looking for "fmt " and "data". A data chunk whose
// declared size runs past the buffer (unfinalized recordings) is clamped.
inline std::optional<Info> parse(std::span<const uint8_t> bytes) {
    auto u16 = [&bytes](size_t at) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + at, 2);
        return v;
    };
    auto u32 = [&bytes](size_t at) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + at, 4);
        return v;
    };
    auto tag_is = [&bytes](size_t at, const char* tag) {
        return std::memcmp(bytes.data() + at, tag, 4) == 0;
    };

    if (bytes.size() < 12 || !tag_is(0, "RIFF") || !tag_is(8, "WAVE")) {
        return std::nullopt;
    }

    Info info;
    bool have_fmt = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = u32(pos + 4);
        size_t body = pos + 8;

        if (tag_is(pos, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) return std::nullopt;
            info.format_tag = u16(body);
            info.channels = u16(body + 2);
            info.sample_rate = u32(body + 4);
            info.bits_per_sample = u16(body + 14);
            have_fmt = true;
        } else if (tag_is(pos, "data")) {
            if (!have_fmt) return std::nullopt;
            info.data_offset = body;
            info.data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            return info;
        }

        // Chunks are word aligned.
        pos = body + chunk_size + (chunk_size & 1);
    }

    return std::nullopt;
}

} // namespace wav
