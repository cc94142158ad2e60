#pragma once

#include <string>
#include <string_view>

enum class SessionPhase {
    Idle,
    Recording,
    Processing,
    Success,
    CopiedToClipboard,  // text copied but not pasted
    Error,
    Empty,
    Cancelled,
};

// Current state of the dictation session. `message` is only set for Error.
struct SessionState {
    SessionPhase phase = SessionPhase::Idle;
    std::string message;

    static SessionState idle() { return {}; }
    static SessionState recording() { return {SessionPhase::Recording, {}}; }
    static SessionState processing() { return {SessionPhase::Processing, {}}; }
    static SessionState success() { return {SessionPhase::Success, {}}; }
    static SessionState copied_to_clipboard() { return {SessionPhase::CopiedToClipboard, {}}; }
    static SessionState error(std::string message) { return {SessionPhase::Error, std::move(message)}; }
    static SessionState empty() { return {SessionPhase::Empty, {}}; }
    static SessionState cancelled() { return {SessionPhase::Cancelled, {}}; }

    // Terminal states wait for the presentation layer to finish dismissing.
    bool is_terminal() const {
        switch (phase) {
            case SessionPhase::Success:
            case SessionPhase::CopiedToClipboard:
            case SessionPhase::Error:
            case SessionPhase::Empty:
            case SessionPhase::Cancelled:
                return true;
            default:
                return false;
        }
    }

    std::string describe() const;

    bool operator==(const SessionState&) const = default;
};

std::string_view to_string(SessionPhase phase);

struct SessionEvent {
    enum class Kind {
        HotkeyPressed,
        StopRecording,
        TranscriptionStarted,
        TranscriptionCompleted,  // payload: transcribed text
        TranscriptionFailed,     // payload: display message
        EscapePressed,
        DismissCompleted,
        ForceReset,              // system interruption, bypasses callbacks
    };

    Kind kind;
    std::string payload;

    static SessionEvent hotkey_pressed() { return {Kind::HotkeyPressed, {}}; }
    static SessionEvent stop_recording() { return {Kind::StopRecording, {}}; }
    static SessionEvent transcription_started() { return {Kind::TranscriptionStarted, {}}; }
    static SessionEvent transcription_completed(std::string text) {
        return {Kind::TranscriptionCompleted, std::move(text)};
    }
    static SessionEvent transcription_failed(std::string reason) {
        return {Kind::TranscriptionFailed, std::move(reason)};
    }
    static SessionEvent escape_pressed() { return {Kind::EscapePressed, {}}; }
    static SessionEvent dismiss_completed() { return {Kind::DismissCompleted, {}}; }
    static SessionEvent force_reset() { return {Kind::ForceReset, {}}; }
};

std::string_view to_string(SessionEvent::Kind kind);

enum class InsertionResult {
    Inserted,
    CopiedToClipboardOnly,
    Failed,
};

std::string_view to_string(InsertionResult result);
