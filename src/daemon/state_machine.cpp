#include "state_machine.hpp"

#include <format>
#include <print>

namespace {

constexpr const char* kInsertionFailedMessage = "Couldn't insert text";

std::string trim(const std::string& s) {
    constexpr const char* ws = " \t\n\r\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::string_view to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle: return "idle";
        case SessionPhase::Recording: return "recording";
        case SessionPhase::Processing: return "processing";
        case SessionPhase::Success: return "success";
        case SessionPhase::CopiedToClipboard: return "copiedToClipboard";
        case SessionPhase::Error: return "error";
        case SessionPhase::Empty: return "empty";
        case SessionPhase::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(SessionEvent::Kind kind) {
    using K = SessionEvent::Kind;
    switch (kind) {
        case K::HotkeyPressed: return "hotkeyPressed";
        case K::StopRecording: return "stopRecording";
        case K::TranscriptionStarted: return "transcriptionStarted";
        case K::TranscriptionCompleted: return "transcriptionCompleted";
        case K::TranscriptionFailed: return "transcriptionFailed";
        case K::EscapePressed: return "escapePressed";
        case K::DismissCompleted: return "dismissCompleted";
        case K::ForceReset: return "forceReset";
    }
    return "unknown";
}

std::string_view to_string(InsertionResult result) {
    switch (result) {
        case InsertionResult::Inserted: return "inserted";
        case InsertionResult::CopiedToClipboardOnly: return "copiedToClipboardOnly";
        case InsertionResult::Failed: return "failed";
    }
    return "unknown";
}

std::string SessionState::describe() const {
    if (phase == SessionPhase::Error) {
        return std::format("error({})", message);
    }
    return std::string(to_string(phase));
}

DictationStateMachine::DictationStateMachine(SessionDelegate& delegate, bool verbose)
    : delegate_(delegate), verbose_(verbose) {}

void DictationStateMachine::send(SessionEvent event) {
    pending_.push_back(std::move(event));
    if (dispatching_) return;

    dispatching_ = true;
    while (!pending_.empty()) {
        auto next = std::move(pending_.front());
        pending_.pop_front();
        handle(next);
    }
    dispatching_ = false;
}

void DictationStateMachine::handle(const SessionEvent& event) {
    using K = SessionEvent::Kind;
    auto previous = state_;

    // Emergency reset is valid from every state and skips all callbacks.
    if (event.kind == K::ForceReset) {
        return_to_idle();
        std::println(stderr, "session: force reset from {}", previous.describe());
        return;
    }

    switch (state_.phase) {
        case SessionPhase::Idle:
            if (event.kind == K::HotkeyPressed) {
                state_ = SessionState::recording();
                delegate_.on_show_panel();
                if (!mock_mode_) delegate_.on_start_recording();
                break;
            }
            log(std::format("ignored {} in {}", to_string(event.kind), state_.describe()));
            return;

        case SessionPhase::Recording:
            if (event.kind == K::HotkeyPressed || event.kind == K::StopRecording) {
                // Stays in recording until transcription reports it has started.
                if (!mock_mode_) delegate_.on_stop_recording();
                break;
            }
            if (event.kind == K::TranscriptionStarted) {
                state_ = SessionState::processing();
                break;
            }
            [[fallthrough]];

        case SessionPhase::Processing:
            if (event.kind == K::TranscriptionCompleted || event.kind == K::TranscriptionFailed) {
                handle_result(event);
                break;
            }
            if (event.kind == K::EscapePressed) {
                state_ = SessionState::cancelled();
                if (!mock_mode_) delegate_.on_cancel();
                break;
            }
            log(std::format("ignored {} in {}", to_string(event.kind), state_.describe()));
            return;

        case SessionPhase::Success:
        case SessionPhase::CopiedToClipboard:
        case SessionPhase::Error:
        case SessionPhase::Empty:
        case SessionPhase::Cancelled:
            if (event.kind == K::DismissCompleted) {
                return_to_idle();
                break;
            }
            log(std::format("ignored {} in {}", to_string(event.kind), state_.describe()));
            return;
    }

    if (state_ != previous) {
        log(std::format("{} -> {}", previous.describe(), state_.describe()));
    }
}

void DictationStateMachine::handle_result(const SessionEvent& event) {
    if (event.kind == SessionEvent::Kind::TranscriptionFailed) {
        state_ = SessionState::error(event.payload);
    } else {
        auto text = trim(event.payload);
        if (text.empty()) {
            state_ = SessionState::empty();
        } else if (mock_mode_) {
            state_ = SessionState::success();
        } else {
            switch (delegate_.on_insert_text(text)) {
                case InsertionResult::Inserted:
                    state_ = SessionState::success();
                    break;
                case InsertionResult::CopiedToClipboardOnly:
                    state_ = SessionState::copied_to_clipboard();
                    break;
                case InsertionResult::Failed:
                    // Delivered text was lost: report loudly.
                    state_ = SessionState::error(kInsertionFailedMessage);
                    break;
            }
        }
    }

    // The panel runs its own dismiss sequence for the new state.
    delegate_.on_hide_panel();
}

void DictationStateMachine::return_to_idle() {
    state_ = SessionState::idle();
    if (mock_mode_) {
        mock_mode_ = false;
        log("mock mode auto-disabled");
    }
}

void DictationStateMachine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxpaste] session: {}", msg);
    }
}
