#pragma once

#include "backend.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <thread>

class TranscriptionCoordinator;

// One background coordinator call. `on_done` runs on the worker thread once
// the outcome is stored; it must only wake the owning thread.
class TranscriptionTask {
public:
    TranscriptionTask(TranscriptionCoordinator& coordinator, AudioArtifact audio,
                      std::function<void()> on_done);
    // Destruction requests stop and joins the worker.

    TranscriptionTask(const TranscriptionTask&) = delete;
    TranscriptionTask& operator=(const TranscriptionTask&) = delete;

    void cancel() { worker_.request_stop(); }
    bool cancelled() const { return worker_.get_stop_token().stop_requested(); }
    bool finished() const { return done_.load(std::memory_order_acquire); }

    // Moves the outcome out. Only valid once finished().
    TranscriptionOutcome take_outcome();

    const AudioArtifact& audio() const { return audio_; }

private:
    AudioArtifact audio_;
    std::optional<TranscriptionOutcome> outcome_;
    std::atomic<bool> done_{false};
    std::jthread worker_;  // last: started once the rest is constructed
};
