#pragma once

#include "platform/audio_recorder.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Mono S16LE capture from the default PipeWire source. Samples collect in a
// ring sized for max_seconds of audio; stop() writes them out as WAV.
class PipeWireRecorder : public AudioRecorder {
public:
    PipeWireRecorder(uint32_t sample_rate, uint32_t max_seconds);
    ~PipeWireRecorder() override;

    PipeWireRecorder(const PipeWireRecorder&) = delete;
    PipeWireRecorder& operator=(const PipeWireRecorder&) = delete;

    std::expected<void, Error> start(const std::filesystem::path& output) override;
    std::expected<void, Error> stop() override;
    bool is_recording() const override { return capturing_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer<int16_t> ring_;
    uint32_t sample_rate_;
    std::filesystem::path output_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
