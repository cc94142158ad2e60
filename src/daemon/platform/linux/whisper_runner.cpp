#include "platform/linux/whisper_runner.hpp"
#include "wav_file.hpp"

#include <whisper.h>

#include <algorithm>
#include <format>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

WhisperRunner::WhisperRunner(bool use_gpu, bool verbose) : use_gpu_(use_gpu) {
    if (!verbose) {
        whisper_log_set([](enum ggml_log_level, const char*, void*) {}, nullptr);
    }
}

WhisperRunner::~WhisperRunner() {
    unload();
}

void WhisperRunner::unload() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
    model_.clear();
}

std::expected<void, std::string> WhisperRunner::load(const fs::path& model) {
    std::error_code ec;
    if (!fs::is_regular_file(model, ec)) {
        return std::unexpected(std::format("{} not found", model.filename().string()));
    }

    unload();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;
    ctx_ = whisper_init_from_file_with_params(model.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected(std::format("couldn't load {}", model.filename().string()));
    }
    model_ = model;
    return {};
}

std::expected<std::string, ModelRunner::Failure>
WhisperRunner::run(const fs::path& wav, const RunnerParams& params, std::stop_token stop) {
    if (!ctx_) return std::unexpected(Failure{false, "no model loaded"});

    auto samples = wav::read_samples(wav);
    if (!samples) return std::unexpected(Failure{false, samples.error()});
    if (samples->sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(Failure{
            false, std::format("audio is {} Hz, the model needs {} Hz",
                               samples->sample_rate, WHISPER_SAMPLE_RATE)});
    }
    if (stop.stop_requested()) return std::unexpected(Failure{true, {}});

    std::vector<float> pcm;
    pcm.reserve(samples->pcm.size());
    for (int16_t s : samples->pcm) {
        pcm.push_back(static_cast<float>(s) / 32768.0f);
    }

    int threads = params.threads > 0
        ? params.threads
        : std::max(1, static_cast<int>(std::thread::hardware_concurrency()));

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_context       = true;
    wparams.no_timestamps    = true;
    wparams.language         = params.language.empty() ? "auto" : params.language.c_str();
    wparams.n_threads        = threads;
    wparams.abort_callback = [](void* data) {
        return static_cast<std::stop_token*>(data)->stop_requested();
    };
    wparams.abort_callback_user_data = &stop;

    int rc = whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (stop.stop_requested()) return std::unexpected(Failure{true, {}});
    if (rc != 0) {
        return std::unexpected(Failure{false, std::format("whisper failed with code {}", rc)});
    }

    std::string text;
    int segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < segments; ++i) {
        if (const char* seg = whisper_full_get_segment_text(ctx_, i)) text += seg;
    }
    return text;
}
