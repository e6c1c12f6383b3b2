#include "platform/linux/pipewire_recorder.hpp"

#include "log.hpp"
#include "wav.hpp"

#include <fstream>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireRecorder::PipeWireRecorder(uint32_t sample_rate, uint32_t max_seconds)
    : ring_(static_cast<size_t>(sample_rate) * max_seconds), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireRecorder::~PipeWireRecorder() {
    teardown();
    pw_deinit();
}

std::expected<void, Error> PipeWireRecorder::start(const std::filesystem::path& output) {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected(make_error(ErrorCode::InvalidState, "already recording"));
    }

    loop_ = pw_thread_loop_new("inkwell", nullptr);
    if (!loop_) {
        return std::unexpected(make_error(ErrorCode::RecorderFailed,
                                          "failed to create PipeWire thread loop"));
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "inkwell",
        PW_KEY_APP_NAME, "inkwell",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "inkwell-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected(make_error(ErrorCode::RecorderFailed,
                                          "failed to create PipeWire stream"));
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    ring_.reset();

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret < 0) {
        teardown();
        return std::unexpected(make_error(ErrorCode::RecorderFailed,
                                          std::string("stream connect failed: ") + spa_strerror(ret)));
    }

    output_ = output;
    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(make_error(ErrorCode::RecorderFailed,
                                          std::string("thread loop start failed: ") + spa_strerror(ret)));
    }

    log_info("audio: capturing at {} Hz into {}", sample_rate_, output_.string());
    return {};
}

std::expected<void, Error> PipeWireRecorder::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected(make_error(ErrorCode::InvalidState, "not recording"));
    }
    teardown();

    auto samples = ring_.drain_all();
    if (ring_.dropped() > 0) {
        log_warn("audio: buffer full, dropped {} samples", ring_.dropped());
    }

    auto data = wav::encode(samples, sample_rate_);
    std::ofstream f(output_, std::ios::binary | std::ios::trunc);
    if (!f.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()))) {
        return std::unexpected(make_error(ErrorCode::RecorderFailed,
                                          "cannot write " + output_.string()));
    }
    log_info("audio: wrote {} samples to {}", samples.size(), output_.string());
    return {};
}

void PipeWireRecorder::teardown() {
    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireRecorder::on_process(void* userdata) {
    auto* self = static_cast<PipeWireRecorder*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->capturing_.load(std::memory_order_relaxed)) {
        auto* data = reinterpret_cast<const int16_t*>(
            static_cast<const uint8_t*>(d->data) + d->chunk->offset);
        self->ring_.write(std::span<const int16_t>(data, d->chunk->size / sizeof(int16_t)));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireRecorder::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                        enum pw_stream_state state, const char* error) {
    if (error) {
        log_warn("audio: stream state {} -> {}: {}", pw_stream_state_as_string(old),
                 pw_stream_state_as_string(state), error);
    }
}
