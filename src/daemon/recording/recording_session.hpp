#pragma once

#include "error.hpp"
#include "platform/audio_recorder.hpp"
#include "recording/session_observer.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

enum class SessionState { Idle, Recording };

const char* to_string(SessionState state);

// Idle <-> Recording state machine over an AudioRecorder. Each recording
// goes to <recordings_dir>/<uuid>.wav. Runs on the daemon's main thread.
//
// With load_audio set, stop_recording() starts reading the file on a
// background task and recorded_audio() collects it. Without it the file is
// left on disk for whoever transcribes it.
class RecordingSession {
public:
    RecordingSession(AudioRecorder& recorder, std::filesystem::path recordings_dir,
                     SessionObserver* observer = nullptr, bool load_audio = true);

    std::expected<std::filesystem::path, Error> start_recording();
    std::expected<std::filesystem::path, Error> stop_recording();
    void cancel_recording();

    // Waits for a pending load. Empty if nothing was loaded.
    const std::vector<uint8_t>& recorded_audio();
    void clear_recorded_audio();

    std::optional<std::filesystem::path> current_recording_path() const { return current_path_; }
    SessionState state() const { return state_; }
    double recording_duration() const;

    void set_observer(SessionObserver* observer) { observer_ = observer; }

    // Random RFC 4122 version 4 UUID, lowercase.
    static std::string make_uuid();

private:
    void fail(const Error& error);

    AudioRecorder& recorder_;
    std::filesystem::path recordings_dir_;
    SessionObserver* observer_;
    bool load_audio_;

    SessionState state_ = SessionState::Idle;
    std::optional<std::filesystem::path> current_path_;
    std::future<std::expected<std::vector<uint8_t>, Error>> pending_audio_;
    std::vector<uint8_t> recorded_audio_;
    std::chrono::steady_clock::time_point record_start_;
};
