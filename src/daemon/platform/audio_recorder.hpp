#pragma once

#include "error.hpp"

#include <expected>
#include <filesystem>

// Captures microphone audio into a WAV file. start() begins capturing for
// the given output path; stop() ends capture and leaves the file on disk.
class AudioRecorder {
public:
    virtual ~AudioRecorder() = default;
    virtual std::expected<void, Error> start(const std::filesystem::path& output) = 0;
    virtual std::expected<void, Error> stop() = 0;
    virtual bool is_recording() const = 0;
};
