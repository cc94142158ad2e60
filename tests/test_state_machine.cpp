#include <catch2/catch_test_macros.hpp>

#include "state_machine.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace {

class RecordingDelegate : public SessionDelegate {
public:
    void on_show_panel() override { calls.push_back("show"); }
    void on_hide_panel() override { calls.push_back("hide"); }
    void on_start_recording() override {
        calls.push_back("start");
        if (on_start) on_start();
    }
    void on_stop_recording() override {
        calls.push_back("stop");
        if (on_stop) on_stop();
    }
    void on_cancel() override { calls.push_back("cancel"); }
    InsertionResult on_insert_text(const std::string& text) override {
        calls.push_back("insert");
        inserted.push_back(text);
        return insert_result;
    }

    int count(const std::string& name) const {
        return static_cast<int>(std::ranges::count(calls, name));
    }

    std::vector<std::string> calls;
    std::vector<std::string> inserted;
    InsertionResult insert_result = InsertionResult::Inserted;
    std::function<void()> on_start;
    std::function<void()> on_stop;
};

// Drives the machine to `processing` through the real transitions.
void to_processing(DictationStateMachine& sm) {
    sm.send(SessionEvent::hotkey_pressed());
    sm.send(SessionEvent::stop_recording());
    sm.send(SessionEvent::transcription_started());
}

std::vector<SessionEvent> all_events() {
    return {
        SessionEvent::hotkey_pressed(),
        SessionEvent::stop_recording(),
        SessionEvent::transcription_started(),
        SessionEvent::transcription_completed("text"),
        SessionEvent::transcription_failed("reason"),
        SessionEvent::escape_pressed(),
        SessionEvent::dismiss_completed(),
        SessionEvent::force_reset(),
    };
}

} // namespace

TEST_CASE("Session transitions", "[session]") {
    RecordingDelegate d;
    DictationStateMachine sm(d);

    SECTION("InitialStateIdle") {
        REQUIRE(sm.state() == SessionState::idle());
        REQUIRE_FALSE(sm.mock_mode());
    }

    SECTION("HotkeyFromIdleStartsRecording") {
        sm.send(SessionEvent::hotkey_pressed());
        REQUIRE(sm.state() == SessionState::recording());
        REQUIRE(d.count("show") == 1);
        REQUIRE(d.count("start") == 1);
        REQUIRE(d.calls == std::vector<std::string>{"show", "start"});
    }

    SECTION("StopKeepsRecordingUntilTranscriptionStarts") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::stop_recording());
        REQUIRE(sm.state() == SessionState::recording());
        REQUIRE(d.count("stop") == 1);

        sm.send(SessionEvent::transcription_started());
        REQUIRE(sm.state() == SessionState::processing());
    }

    SECTION("SecondHotkeyStopsRecording") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::hotkey_pressed());
        REQUIRE(d.count("stop") == 1);
        REQUIRE(d.count("start") == 1);
    }

    SECTION("CompletedTextIsInserted") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::stop_recording());
        sm.send(SessionEvent::transcription_completed("Hello world"));

        REQUIRE(d.inserted == std::vector<std::string>{"Hello world"});
        REQUIRE(sm.state() == SessionState::success());
        REQUIRE(d.calls.back() == "hide");
    }

    SECTION("ClipboardOnlyInsertion") {
        d.insert_result = InsertionResult::CopiedToClipboardOnly;
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::stop_recording());
        sm.send(SessionEvent::transcription_completed("Hello world"));

        REQUIRE(d.inserted == std::vector<std::string>{"Hello world"});
        REQUIRE(sm.state() == SessionState::copied_to_clipboard());
    }

    SECTION("FailedInsertionIsAnError") {
        d.insert_result = InsertionResult::Failed;
        to_processing(sm);
        sm.send(SessionEvent::transcription_completed("Hello world"));
        REQUIRE(sm.state() == SessionState::error("Couldn't insert text"));
    }

    SECTION("TextIsTrimmedBeforeInsertion") {
        to_processing(sm);
        sm.send(SessionEvent::transcription_completed("  Hello world \n"));
        REQUIRE(d.inserted == std::vector<std::string>{"Hello world"});
    }

    SECTION("WhitespaceOnlyIsEmpty") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::transcription_completed("   "));
        REQUIRE(sm.state() == SessionState::empty());
        REQUIRE(d.count("insert") == 0);
        REQUIRE(d.count("hide") == 1);
    }

    SECTION("FailureCarriesMessage") {
        to_processing(sm);
        sm.send(SessionEvent::transcription_failed("Couldn't connect: timeout"));
        REQUIRE(sm.state() == SessionState::error("Couldn't connect: timeout"));
        REQUIRE(d.count("hide") == 1);
        REQUIRE(d.count("insert") == 0);
    }

    SECTION("EscapeDuringProcessingCancels") {
        to_processing(sm);
        sm.send(SessionEvent::escape_pressed());
        REQUIRE(sm.state() == SessionState::cancelled());
        REQUIRE(d.count("cancel") == 1);
    }

    SECTION("EscapeDuringRecordingCancels") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::escape_pressed());
        REQUIRE(sm.state() == SessionState::cancelled());
        REQUIRE(d.count("cancel") == 1);
    }

    SECTION("ForceResetSkipsCallbacks") {
        to_processing(sm);
        auto before = d.calls.size();
        sm.send(SessionEvent::force_reset());
        REQUIRE(sm.state() == SessionState::idle());
        REQUIRE(d.calls.size() == before);
    }

    SECTION("DismissReturnsToIdle") {
        to_processing(sm);
        sm.send(SessionEvent::transcription_completed("done"));
        sm.send(SessionEvent::dismiss_completed());
        REQUIRE(sm.state() == SessionState::idle());
    }

    SECTION("DismissWhileIdleIsNoop") {
        sm.send(SessionEvent::dismiss_completed());
        REQUIRE(sm.state() == SessionState::idle());
        REQUIRE(d.calls.empty());
    }

    SECTION("LateResultAfterCancelIsIgnored") {
        to_processing(sm);
        sm.send(SessionEvent::escape_pressed());
        sm.send(SessionEvent::transcription_completed("too late"));
        REQUIRE(sm.state() == SessionState::cancelled());
        REQUIRE(d.count("insert") == 0);
    }
}

TEST_CASE("Session ignores events absent from the table", "[session]") {
    using K = SessionEvent::Kind;

    // (setup, events the state accepts)
    struct Case {
        const char* name;
        std::function<void(DictationStateMachine&)> setup;
        std::vector<K> accepted;
    };
    std::vector<Case> cases = {
        {"idle", [](DictationStateMachine&) {}, {K::HotkeyPressed}},
        {"recording", [](DictationStateMachine& sm) { sm.send(SessionEvent::hotkey_pressed()); },
         {K::HotkeyPressed, K::StopRecording, K::TranscriptionStarted, K::TranscriptionCompleted,
          K::TranscriptionFailed, K::EscapePressed}},
        {"processing", [](DictationStateMachine& sm) { to_processing(sm); },
         {K::TranscriptionCompleted, K::TranscriptionFailed, K::EscapePressed}},
        {"success",
         [](DictationStateMachine& sm) {
             to_processing(sm);
             sm.send(SessionEvent::transcription_completed("x"));
         },
         {K::DismissCompleted}},
        {"error",
         [](DictationStateMachine& sm) {
             to_processing(sm);
             sm.send(SessionEvent::transcription_failed("x"));
         },
         {K::DismissCompleted}},
        {"cancelled",
         [](DictationStateMachine& sm) {
             to_processing(sm);
             sm.send(SessionEvent::escape_pressed());
         },
         {K::DismissCompleted}},
    };

    for (auto& c : cases) {
        for (auto& event : all_events()) {
            if (event.kind == K::ForceReset) continue;
            if (std::ranges::find(c.accepted, event.kind) != c.accepted.end()) continue;

            RecordingDelegate d;
            DictationStateMachine sm(d);
            c.setup(sm);
            auto before = sm.state();
            auto calls_before = d.calls.size();

            sm.send(event);

            INFO(c.name << " + " << to_string(event.kind));
            REQUIRE(sm.state() == before);
            REQUIRE(d.calls.size() == calls_before);
        }
    }
}

TEST_CASE("Session force reset from every state", "[session]") {
    std::vector<std::function<void(DictationStateMachine&)>> setups = {
        [](DictationStateMachine&) {},
        [](DictationStateMachine& sm) { sm.send(SessionEvent::hotkey_pressed()); },
        [](DictationStateMachine& sm) { to_processing(sm); },
        [](DictationStateMachine& sm) {
            to_processing(sm);
            sm.send(SessionEvent::transcription_completed("   "));
        },
    };

    for (auto& setup : setups) {
        RecordingDelegate d;
        DictationStateMachine sm(d);
        setup(sm);
        sm.set_mock_mode(true);
        auto calls_before = d.calls.size();

        sm.send(SessionEvent::force_reset());
        REQUIRE(sm.state() == SessionState::idle());
        REQUIRE_FALSE(sm.mock_mode());
        REQUIRE(d.calls.size() == calls_before);
    }
}

TEST_CASE("Session mock mode", "[session]") {
    RecordingDelegate d;
    DictationStateMachine sm(d);
    sm.set_mock_mode(true);

    SECTION("DrivesTransitionsWithoutSideEffects") {
        sm.send(SessionEvent::hotkey_pressed());
        REQUIRE(sm.state() == SessionState::recording());
        sm.send(SessionEvent::stop_recording());
        sm.send(SessionEvent::transcription_started());
        sm.send(SessionEvent::transcription_completed("mock text"));

        REQUIRE(sm.state() == SessionState::success());
        REQUIRE(d.count("start") == 0);
        REQUIRE(d.count("stop") == 0);
        REQUIRE(d.count("insert") == 0);
        // Presentation callbacks still run.
        REQUIRE(d.count("show") == 1);
        REQUIRE(d.count("hide") == 1);
    }

    SECTION("CancelSuppressed") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::escape_pressed());
        REQUIRE(sm.state() == SessionState::cancelled());
        REQUIRE(d.count("cancel") == 0);
    }

    SECTION("ClearedOnReturnToIdle") {
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::transcription_failed("x"));
        REQUIRE(sm.mock_mode());
        sm.send(SessionEvent::dismiss_completed());
        REQUIRE_FALSE(sm.mock_mode());

        // The next session is real.
        sm.send(SessionEvent::hotkey_pressed());
        REQUIRE(d.count("start") == 1);
    }
}

TEST_CASE("Session events sent from callbacks are queued", "[session]") {
    RecordingDelegate d;
    DictationStateMachine sm(d);

    SECTION("SetupFailureDuringStart") {
        d.on_start = [&] {
            // Still mid-transition: the machine hasn't finished entering recording.
            sm.send(SessionEvent::transcription_failed("Couldn't start recording: no device"));
            REQUIRE(sm.state() == SessionState::recording());
        };
        sm.send(SessionEvent::hotkey_pressed());
        REQUIRE(sm.state() == SessionState::error("Couldn't start recording: no device"));
        REQUIRE(d.calls == std::vector<std::string>{"show", "start", "hide"});
    }

    SECTION("ArrivalOrderPreserved") {
        d.on_stop = [&] {
            sm.send(SessionEvent::transcription_started());
            sm.send(SessionEvent::transcription_completed("queued"));
        };
        sm.send(SessionEvent::hotkey_pressed());
        sm.send(SessionEvent::stop_recording());
        REQUIRE(sm.state() == SessionState::success());
        REQUIRE(d.inserted == std::vector<std::string>{"queued"});
    }
}

TEST_CASE("Session state descriptions", "[session]") {
    REQUIRE(SessionState::idle().describe() == "idle");
    REQUIRE(SessionState::copied_to_clipboard().describe() == "copiedToClipboard");
    REQUIRE(SessionState::error("boom").describe() == "error(boom)");
    REQUIRE(SessionState::empty().is_terminal());
    REQUIRE_FALSE(SessionState::processing().is_terminal());
}
