#include "transcription_task.hpp"

#include "transcription/coordinator.hpp"

TranscriptionTask::TranscriptionTask(TranscriptionCoordinator& coordinator, AudioArtifact audio,
                                     std::function<void()> on_done)
    : audio_(std::move(audio)),
      worker_([this, &coordinator, on_done = std::move(on_done)](std::stop_token stop) {
          outcome_ = coordinator.transcribe(audio_, stop);
          done_.store(true, std::memory_order_release);
          if (on_done) on_done();
      }) {}

TranscriptionOutcome TranscriptionTask::take_outcome() {
    if (!outcome_) return std::unexpected(TranscriptionError::cancelled());
    auto out = std::move(*outcome_);
    outcome_.reset();
    return out;
}
