#pragma once

#include "error.hpp"
#include "wav.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

struct PreprocessedAudio {
    std::vector<uint8_t> bytes;
    double duration_s = 0.0;
    wav::Info format;
};

class AudioPreprocessor {
public:
    static constexpr uint32_t MIN_SAMPLE_RATE = 8000;
    static constexpr uint32_t MAX_SAMPLE_RATE = 48000;
    static constexpr uint32_t WHISPER_SAMPLE_RATE = 16000;

    explicit AudioPreprocessor(bool validate_format = true);

    // Reads the whole file off the calling thread, then derives the duration
    // from the container header.
    std::expected<PreprocessedAudio, Error> preprocess(const std::filesystem::path& path) const;

    static std::expected<void, Error> validate(const wav::Info& info);

    static std::expected<std::vector<uint8_t>, Error> read_file(const std::filesystem::path& path);

    // 16-bit PCM to mono float in [-1, 1]. Stereo input is averaged.
    static std::expected<std::vector<float>, Error> read_samples(const std::filesystem::path& path,
                                                                 uint32_t* sample_rate = nullptr);
    static std::expected<std::vector<float>, Error> decode_samples(const std::vector<uint8_t>& bytes,
                                                                   uint32_t* sample_rate = nullptr);

    // Linear interpolation, enough for speech.
    static std::vector<float> resample(const std::vector<float>& input, uint32_t in_rate,
                                       uint32_t out_rate = WHISPER_SAMPLE_RATE);

private:
    bool validate_;
};
