#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <string>

namespace {

// Seconds to wait for the stream to leave the connecting state.
constexpr int kConnectTimeoutS = 2;

} // namespace

PipeWireCapture::PipeWireCapture(SampleRing& ring, LevelMeter& meter, uint32_t sample_rate)
    : ring_(ring), meter_(meter), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::expected<void, std::string> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("voxpaste", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "voxpaste",
        PW_KEY_APP_NAME, "voxpaste",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "voxpaste-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("failed to create capture stream");
    }

    // S16_LE, mono, at the configured rate (16 kHz for whisper)
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    ring_.clear();
    meter_.reset();
    stream_failed_.store(false, std::memory_order_relaxed);

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
        std::string err = std::string("stream connect failed: ") + spa_strerror(ret);
        teardown();
        return std::unexpected(err);
    }

    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::string err = std::string("thread loop start failed: ") + spa_strerror(ret);
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(err);
    }

    // Wait until the session manager has linked us to a source (or refused).
    pw_thread_loop_lock(loop_);
    const char* error = nullptr;
    auto state = pw_stream_get_state(stream_, &error);
    while (state == PW_STREAM_STATE_CONNECTING && !stream_failed_.load(std::memory_order_relaxed)) {
        if (pw_thread_loop_timed_wait(loop_, kConnectTimeoutS) != 0) break;
        state = pw_stream_get_state(stream_, &error);
    }
    std::string failure;
    if (state == PW_STREAM_STATE_ERROR || state == PW_STREAM_STATE_UNCONNECTED) {
        failure = error ? error : "no capture device available";
    }
    pw_thread_loop_unlock(loop_);

    if (!failure.empty()) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected("capture device unavailable: " + failure);
    }

    return {};
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::teardown() {
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

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* bytes = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    std::span<const int16_t> samples(reinterpret_cast<const int16_t*>(bytes),
                                     d->chunk->size / sizeof(int16_t));

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_.push(samples);
        self->meter_.update(samples);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    if (state == PW_STREAM_STATE_ERROR) {
        self->stream_failed_.store(true, std::memory_order_relaxed);
    }
    // Wake start() if it is waiting for the connection outcome.
    pw_thread_loop_signal(self->loop_, false);
}
