#pragma once

#include "session_state.hpp"

#include <deque>
#include <string>

// Collaborators driven by the state machine (panel, recorder, transcription,
// text insertion). Implemented by the daemon core.
class SessionDelegate {
public:
    virtual ~SessionDelegate() = default;
    virtual void on_show_panel() = 0;
    virtual void on_hide_panel() = 0;
    virtual void on_start_recording() = 0;
    // Stop capture and hand the audio to transcription.
    virtual void on_stop_recording() = 0;
    // Cancel transcription, stop and delete the recording.
    virtual void on_cancel() = 0;
    virtual InsertionResult on_insert_text(const std::string& text) = 0;
};

// Single source of truth for the dictation session.
//
// State transitions:
// - idle -> recording (hotkey)
// - recording -> processing (transcription started)
// - recording/processing -> success/copiedToClipboard/empty/error (result)
// - recording/processing -> cancelled (escape)
// - terminal -> idle (dismiss completed)
// - any -> idle (force reset, no callbacks)
//
// Not thread-safe: all events must arrive on one thread. Events sent from
// inside a delegate callback are queued and handled after the current one.
class DictationStateMachine {
public:
    explicit DictationStateMachine(SessionDelegate& delegate, bool verbose = false);

    DictationStateMachine(const DictationStateMachine&) = delete;
    DictationStateMachine& operator=(const DictationStateMachine&) = delete;

    void send(SessionEvent event);

    const SessionState& state() const { return state_; }

    // Suppresses recording/transcription/cancel/insertion side effects while
    // still driving real transitions. Cleared whenever the state returns to idle.
    void set_mock_mode(bool enabled) { mock_mode_ = enabled; }
    bool mock_mode() const { return mock_mode_; }

private:
    void handle(const SessionEvent& event);
    void handle_result(const SessionEvent& event);
    void return_to_idle();
    void log(const std::string& msg);

    SessionDelegate& delegate_;
    bool verbose_;
    SessionState state_;
    bool mock_mode_ = false;

    bool dispatching_ = false;
    std::deque<SessionEvent> pending_;
};
