#include "local_backend.hpp"

#include "transcription/model_catalog.hpp"
#include "transcription/output_filter.hpp"

#include <format>
#include <future>
#include <print>

LocalBackend::LocalBackend(ModelRunner& runner, bool verbose)
    : runner_(runner), verbose_(verbose) {}

void LocalBackend::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[voxpaste] local: {}", msg);
}

std::optional<std::string> LocalBackend::validate(const Config& config) const {
    ModelCatalog catalog(config.local.resolved_model_dir());
    return catalog.validate(config.local.model);
}

TranscriptionOutcome LocalBackend::transcribe(const AudioArtifact& audio, const Config& config,
                                              std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto result = run_on_executor(audio, config, stop);
    if (!result) return result;

    result->text = output_filter::apply(result->text);
    result->duration_s = audio.duration_s;
    result->processing_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

TranscriptionOutcome LocalBackend::run_on_executor(const AudioArtifact& audio,
                                                   const Config& config, std::stop_token stop) {
    using Kind = TranscriptionError::Kind;

    ModelCatalog catalog(config.local.resolved_model_dir());
    auto model = catalog.resolve(config.local.model);
    if (!model) {
        return std::unexpected(TranscriptionError{Kind::NoModelAvailable, {}});
    }
    if (!config.local.model.empty() && model->name != config.local.model &&
        model->path.filename() != config.local.model) {
        log(std::format("model '{}' not installed, using {}", config.local.model, model->name));
    }

    RunnerParams params{
        .language = config.transcription.language,
        .threads = config.local.threads,
    };

    // The job may outlive this call when the caller gives up on it, so it
    // owns copies of everything it touches except the runner.
    auto fut = executor_.submit(
        [this, model_path = model->path, wav = audio.path, params, stop]() -> TranscriptionOutcome {
            if (stop.stop_requested()) return std::unexpected(TranscriptionError::cancelled());

            if (runner_.loaded_model() != model_path) {
                log("loading " + model_path.filename().string());
                auto loaded = runner_.load(model_path);
                if (!loaded) {
                    return std::unexpected(TranscriptionError{Kind::ModelLoadFailed,
                                                              loaded.error()});
                }
            }

            auto text = runner_.run(wav, params, stop);
            if (!text) {
                if (text.error().cancelled) {
                    return std::unexpected(TranscriptionError::cancelled());
                }
                return std::unexpected(TranscriptionError{Kind::BackendRejected,
                                                          text.error().message});
            }
            return TranscriptResult{.text = std::move(*text)};
        });

    while (fut.wait_for(kStopPoll) != std::future_status::ready) {
        if (stop.stop_requested()) {
            log("cancelled while waiting for the model");
            return std::unexpected(TranscriptionError::cancelled());
        }
    }
    return fut.get();
}
