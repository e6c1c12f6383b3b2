#include "recording/recording_session.hpp"

#include "audio/audio_preprocessor.hpp"
#include "log.hpp"

#include <format>
#include <future>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Recording: return "recording";
    }
    return "unknown";
}

RecordingSession::RecordingSession(AudioRecorder& recorder, fs::path recordings_dir,
                                   SessionObserver* observer, bool load_audio)
    : recorder_(recorder), recordings_dir_(std::move(recordings_dir)), observer_(observer),
      load_audio_(load_audio) {}

std::string RecordingSession::make_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // variant 10

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                       lo >> 48, lo & 0xFFFFFFFFFFFFull);
}

std::expected<fs::path, Error> RecordingSession::start_recording() {
    if (state_ != SessionState::Idle) {
        log_warn("session: cannot start, state is {}", to_string(state_));
        return std::unexpected(make_error(ErrorCode::InvalidState,
                                          std::string("cannot start while ") + to_string(state_)));
    }

    std::error_code ec;
    fs::create_directories(recordings_dir_, ec);
    if (ec) {
        auto err = make_error(ErrorCode::RecorderFailed,
                              "cannot create " + recordings_dir_.string() + ": " + ec.message());
        fail(err);
        return std::unexpected(err);
    }

    auto path = recordings_dir_ / (make_uuid() + ".wav");
    clear_recorded_audio();
    current_path_ = path;
    state_ = SessionState::Recording;

    if (auto ok = recorder_.start(path); !ok) {
        log_error("session: recorder failed to start: {}", ok.error().message);
        current_path_.reset();
        state_ = SessionState::Idle;
        fail(ok.error());
        return std::unexpected(ok.error());
    }

    record_start_ = std::chrono::steady_clock::now();
    log_info("session: recording to {}", path.string());
    if (observer_) observer_->session_did_start();
    return path;
}

std::expected<fs::path, Error> RecordingSession::stop_recording() {
    if (state_ != SessionState::Recording) {
        return std::unexpected(make_error(ErrorCode::InvalidState, "not recording"));
    }

    auto stopped = recorder_.stop();
    auto path = std::move(current_path_);
    current_path_.reset();
    state_ = SessionState::Idle;

    if (!stopped) {
        log_error("session: recorder failed to stop: {}", stopped.error().message);
        fail(stopped.error());
        return std::unexpected(stopped.error());
    }

    if (!path) {
        auto err = make_error(ErrorCode::NoRecordingUrl, "no recording was produced");
        fail(err);
        return std::unexpected(err);
    }

    std::error_code ec;
    if (!fs::is_regular_file(*path, ec)) {
        auto err = make_error(ErrorCode::NoRecordingUrl, "recording missing: " + path->string());
        fail(err);
        return std::unexpected(err);
    }

    if (load_audio_) {
        pending_audio_ = std::async(std::launch::async, [p = *path] {
            return AudioPreprocessor::read_file(p);
        });
    }

    log_info("session: recorded to {}", path->string());
    if (observer_) observer_->session_did_complete(*path);
    return *path;
}

void RecordingSession::cancel_recording() {
    if (state_ != SessionState::Recording) {
        log_warn("session: nothing to cancel");
        return;
    }

    if (auto ok = recorder_.stop(); !ok) {
        log_warn("session: recorder stop during cancel: {}", ok.error().message);
    }

    if (current_path_) {
        std::error_code ec;
        fs::remove(*current_path_, ec);
        if (ec) log_warn("session: cannot remove {}: {}", current_path_->string(), ec.message());
    }

    current_path_.reset();
    clear_recorded_audio();
    state_ = SessionState::Idle;
    log_info("session: cancelled");
    if (observer_) observer_->session_did_cancel();
}

const std::vector<uint8_t>& RecordingSession::recorded_audio() {
    if (pending_audio_.valid()) {
        auto bytes = pending_audio_.get();
        if (bytes) {
            recorded_audio_ = std::move(*bytes);
        } else {
            log_warn("session: cannot load recording: {}", bytes.error().message);
        }
    }
    return recorded_audio_;
}

void RecordingSession::clear_recorded_audio() {
    pending_audio_ = {};
    recorded_audio_.clear();
    recorded_audio_.shrink_to_fit();
}

double RecordingSession::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

void RecordingSession::fail(const Error& error) {
    if (observer_) observer_->session_did_fail(error);
}
