#include "audio/audio_preprocessor.hpp"

#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <future>

namespace fs = std::filesystem;

AudioPreprocessor::AudioPreprocessor(bool validate_format)
    : validate_(validate_format) {}

std::expected<PreprocessedAudio, Error>
AudioPreprocessor::preprocess(const fs::path& path) const {
    log_info("audio: preprocessing {}", path.filename().string());

    auto pending = std::async(std::launch::async, [path] { return read_file(path); });
    auto bytes = pending.get();
    if (!bytes) return std::unexpected(bytes.error());

    auto info = wav::parse(*bytes);
    if (!info) {
        return std::unexpected(make_error(ErrorCode::InvalidAudioData,
                                          "not a RIFF/WAVE file: " + path.string()));
    }

    if (validate_) {
        auto ok = validate(*info);
        if (!ok) return std::unexpected(ok.error());
    }

    double duration = info->duration_s();
    log_info("audio: {:.2f}s, {} bytes, {} Hz, {} ch", duration, bytes->size(),
             info->sample_rate, info->channels);

    return PreprocessedAudio{
        .bytes = std::move(*bytes),
        .duration_s = duration,
        .format = *info,
    };
}

std::expected<void, Error> AudioPreprocessor::validate(const wav::Info& info) {
    if (info.sample_rate < MIN_SAMPLE_RATE || info.sample_rate > MAX_SAMPLE_RATE) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedSampleRate,
            std::format("unsupported sample rate: {} Hz (supported 8000-48000 Hz)",
                        info.sample_rate)));
    }
    if (info.channels != 1 && info.channels != 2) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedChannelCount,
            std::format("unsupported channel count: {} (mono or stereo)", info.channels)));
    }
    bool pcm = info.format_tag == wav::FORMAT_PCM || info.format_tag == wav::FORMAT_EXTENSIBLE;
    if (!pcm || info.bits_per_sample != 16) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedBitDepth,
            std::format("unsupported format (tag {}, {} bits): 16-bit PCM required",
                        info.format_tag, info.bits_per_sample)));
    }
    return {};
}

std::expected<std::vector<uint8_t>, Error> AudioPreprocessor::read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f.is_open()) {
        return std::unexpected(make_error(ErrorCode::AudioFileNotFound,
                                          "cannot open " + path.string()));
    }

    auto size = f.tellg();
    if (size < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidAudioData,
                                          "cannot size " + path.string()));
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    f.seekg(0);
    if (!bytes.empty() && !f.read(reinterpret_cast<char*>(bytes.data()), size)) {
        return std::unexpected(make_error(ErrorCode::InvalidAudioData,
                                          "short read on " + path.string()));
    }
    return bytes;
}

std::expected<std::vector<float>, Error>
AudioPreprocessor::read_samples(const fs::path& path, uint32_t* sample_rate) {
    auto bytes = read_file(path);
    if (!bytes) return std::unexpected(bytes.error());
    return decode_samples(*bytes, sample_rate);
}

std::expected<std::vector<float>, Error>
AudioPreprocessor::decode_samples(const std::vector<uint8_t>& bytes, uint32_t* sample_rate) {
    auto info = wav::parse(bytes);
    if (!info) {
        return std::unexpected(make_error(ErrorCode::InvalidAudioData, "not a RIFF/WAVE file"));
    }
    if (info->bits_per_sample != 16 || info->channels == 0) {
        return std::unexpected(make_error(ErrorCode::UnsupportedBitDepth,
                                          "16-bit PCM required"));
    }

    const size_t channels = info->channels;
    const size_t frames = info->data_size / (sizeof(int16_t) * channels);
    const uint8_t* data = bytes.data() + info->data_offset;

    std::vector<float> out;
    out.reserve(frames);
    constexpr float scale = 1.0f / 32768.0f;

    for (size_t i = 0; i < frames; ++i) {
        float acc = 0.0f;
        for (size_t c = 0; c < channels; ++c) {
            int16_t s;
            std::memcpy(&s, data + (i * channels + c) * sizeof(int16_t), sizeof(s));
            acc += static_cast<float>(s) * scale;
        }
        out.push_back(acc / static_cast<float>(channels));
    }

    if (sample_rate) *sample_rate = info->sample_rate;
    return out;
}

std::vector<float> AudioPreprocessor::resample(const std::vector<float>& input, uint32_t in_rate,
                                               uint32_t out_rate) {
    if (input.empty() || in_rate == 0) return {};
    if (in_rate == out_rate) return input;

    const double ratio = static_cast<double>(out_rate) / static_cast<double>(in_rate);
    const size_t out_len = static_cast<size_t>(
        std::ceil(static_cast<double>(input.size()) * ratio));

    std::vector<float> output(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_idx = static_cast<double>(i) / ratio;
        size_t idx0 = std::min(static_cast<size_t>(src_idx), input.size() - 1);
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);
        double frac = src_idx - static_cast<double>(idx0);
        output[i] = static_cast<float>(input[idx0] * (1.0 - frac) + input[idx1] * frac);
    }
    return output;
}
