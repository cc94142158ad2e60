#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <print>

using json = nlohmann::json;

DaemonCore::DaemonCore(ConfigStore& config, bool verbose,
                       RecordingService& recording, TranscriptionCoordinator& coordinator,
                       TextInserter& inserter, IpcServer& ipc,
                       NotifyCallback notify, DismissTimer dismiss_timer)
    : config_(config), verbose_(verbose),
      recording_(recording), coordinator_(coordinator),
      inserter_(inserter), ipc_(ipc),
      notify_(std::move(notify)),
      dismiss_timer_(std::move(dismiss_timer)),
      machine_(*this, verbose) {}

DaemonCore::~DaemonCore() = default;

json DaemonCore::handle_command(const json& cmd) {
    if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
        return {{"status", "error"}, {"message", "invalid command"}};
    }

    auto name = cmd["cmd"].get<std::string>();
    if (name == "toggle") return handle_toggle();
    if (name == "start") return handle_start();
    if (name == "stop") return handle_stop();
    if (name == "cancel") return handle_cancel();
    if (name == "dismiss") {
        dispatch(SessionEvent::dismiss_completed());
        return state_response();
    }
    if (name == "reset") {
        emergency_reset("requested over IPC");
        return state_response();
    }
    if (name == "status") return handle_status();
    if (name == "validate") return handle_validate();
    if (name == "simulate") return handle_simulate(cmd);
    return {{"status", "error"}, {"message", "unknown command: " + name}};
}

json DaemonCore::handle_toggle() {
    if (machine_.state().phase == SessionPhase::Recording) {
        return handle_stop();
    }
    dispatch(SessionEvent::hotkey_pressed());
    return state_response();
}

json DaemonCore::handle_start() {
    if (machine_.state().phase != SessionPhase::Idle) {
        return {{"status", "error"},
                {"message", "session already active (" + machine_.state().describe() + ")"}};
    }
    dispatch(SessionEvent::hotkey_pressed());
    return state_response();
}

json DaemonCore::handle_stop() {
    if (machine_.state().phase != SessionPhase::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }
    dispatch(SessionEvent::stop_recording());
    return stop_response();
}

json DaemonCore::handle_cancel() {
    if (!panel_visible_) {
        return {{"status", "error"}, {"message", "nothing to cancel"}};
    }
    dispatch(SessionEvent::escape_pressed());
    return state_response();
}

json DaemonCore::handle_status() {
    auto& state = machine_.state();
    json resp = {
        {"status", "ok"},
        {"state", to_string(state.phase)},
        {"mode", to_string(coordinator_.current_mode())},
        {"mock", machine_.mock_mode()},
    };
    if (state.phase == SessionPhase::Error) resp["message"] = state.message;
    if (state.phase == SessionPhase::Recording) {
        resp["duration"] = recording_.recording_duration();
        resp["level"] = recording_.audio_level();
    }
    if (!last_text_.empty()) resp["last_text"] = last_text_;
    return resp;
}

json DaemonCore::handle_validate() {
    auto mode = to_string(coordinator_.current_mode());
    if (auto problem = coordinator_.validate_configuration()) {
        return {{"status", "error"}, {"mode", mode}, {"message", *problem}};
    }
    return {{"status", "ok"}, {"mode", mode}};
}

json DaemonCore::handle_simulate(const json& cmd) {
    if ((cmd.contains("event") && !cmd["event"].is_string()) ||
        (cmd.contains("text") && !cmd["text"].is_string())) {
        return {{"status", "error"}, {"message", "simulate: event and text must be strings"}};
    }
    auto event_name = cmd.value("event", "");
    auto text = cmd.value("text", "");

    std::optional<SessionEvent> event;
    if (event_name == "hotkey") event = SessionEvent::hotkey_pressed();
    else if (event_name == "stop") event = SessionEvent::stop_recording();
    else if (event_name == "started") event = SessionEvent::transcription_started();
    else if (event_name == "completed") event = SessionEvent::transcription_completed(text);
    else if (event_name == "failed") event = SessionEvent::transcription_failed(text);
    else if (event_name == "escape") event = SessionEvent::escape_pressed();
    else if (event_name == "dismiss") event = SessionEvent::dismiss_completed();

    if (!event) {
        return {{"status", "error"}, {"message", "unknown event: " + event_name}};
    }

    auto phase = machine_.state().phase;
    if (phase == SessionPhase::Idle) {
        machine_.set_mock_mode(true);
        log("mock session started");
    } else if (!machine_.mock_mode()) {
        return {{"status", "error"}, {"message", "a real session is active"}};
    }

    if (event->kind == SessionEvent::Kind::TranscriptionCompleted) last_text_ = text;
    dispatch(std::move(*event));
    return state_response();
}

void DaemonCore::dispatch(SessionEvent event) {
    machine_.send(std::move(event));
    after_transition();
}

void DaemonCore::after_transition() {
    auto& state = machine_.state();

    if (state.is_terminal()) {
        // Stand-in for the panel's dismiss animation.
        if (!dismiss_armed_) {
            dismiss_timer_(std::max(1, config_.snapshot().presentation.dismiss_ms));
            dismiss_armed_ = true;
        }
    } else if (state.phase == SessionPhase::Idle) {
        if (dismiss_armed_) {
            dismiss_timer_(0);
            dismiss_armed_ = false;
        }
        panel_visible_ = false;
    } else {
        return;
    }

    if (waiting_clients_.empty()) return;
    auto response = stop_response();
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

json DaemonCore::state_response() const {
    auto& state = machine_.state();
    json resp = {{"status", "ok"}, {"state", to_string(state.phase)}};
    switch (state.phase) {
        case SessionPhase::Error:
            resp["status"] = "error";
            resp["message"] = state.message;
            break;
        case SessionPhase::Success:
        case SessionPhase::CopiedToClipboard:
            resp["text"] = last_text_;
            break;
        default:
            break;
    }
    return resp;
}

json DaemonCore::stop_response() const {
    auto phase = machine_.state().phase;
    if (phase == SessionPhase::Recording || phase == SessionPhase::Processing) {
        return {{"status", "transcribing"}};
    }
    return state_response();
}

void DaemonCore::on_transcription_complete() {
    reap_retired();
    if (!task_ || !task_->finished()) return;

    auto task = std::move(task_);
    auto outcome = task->take_outcome();
    recording_.delete_recording();

    if (!outcome) {
        if (outcome.error().kind == TranscriptionError::Kind::Cancelled) {
            log("transcription cancelled, result discarded");
            return;
        }
        dispatch(SessionEvent::transcription_failed(outcome.error().message()));
        return;
    }

    log(std::format("transcribed {:.1f}s of audio in {:.1f}s, {} chars",
                    outcome->duration_s, outcome->processing_s, outcome->text.size()));
    last_text_ = outcome->text;
    dispatch(SessionEvent::transcription_completed(std::move(outcome->text)));
}

void DaemonCore::on_dismiss_timer() {
    dismiss_armed_ = false;
    dispatch(SessionEvent::dismiss_completed());
}

void DaemonCore::emergency_reset(const std::string& reason) {
    std::println(stderr, "daemon: emergency reset ({})", reason);
    cancel_task();
    if (recording_.is_recording()) recording_.stop_recording();
    recording_.delete_recording();
    dispatch(SessionEvent::force_reset());
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    cancel_task();
    if (recording_.is_recording()) recording_.stop_recording();
    recording_.delete_recording();

    json response = {{"status", "error"}, {"message", "daemon shutting down"}};
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();

    if (!retired_.empty()) log("waiting for cancelled transcriptions to stop");
    retired_.clear();
}

void DaemonCore::on_show_panel() {
    panel_visible_ = true;
    last_text_.clear();
}

void DaemonCore::on_hide_panel() {
    panel_visible_ = false;
}

void DaemonCore::on_start_recording() {
    if (auto res = recording_.start_recording(); !res) {
        std::println(stderr, "daemon: {}", res.error());
        machine_.send(SessionEvent::transcription_failed(res.error()));
        return;
    }
    log("recording started");
}

void DaemonCore::on_stop_recording() {
    if (task_) {
        log("transcription already running");
        return;
    }

    auto audio = recording_.stop_recording();
    if (!audio) {
        machine_.send(SessionEvent::transcription_failed("No recording available"));
        return;
    }

    log(std::format("recording stopped, {:.1f}s of audio, transcribing", audio->duration_s));
    task_ = std::make_unique<TranscriptionTask>(coordinator_, std::move(*audio), notify_);
    machine_.send(SessionEvent::transcription_started());
}

void DaemonCore::on_cancel() {
    cancel_task();
    if (recording_.is_recording()) recording_.stop_recording();
    recording_.delete_recording();
    log("session cancelled");
}

InsertionResult DaemonCore::on_insert_text(const std::string& text) {
    auto result = inserter_.insert(text, config_.snapshot().insertion);
    log(std::format("insertion: {}", to_string(result)));
    return result;
}

void DaemonCore::cancel_task() {
    if (!task_) return;
    task_->cancel();
    retired_.push_back(std::move(task_));
    reap_retired();
}

void DaemonCore::reap_retired() {
    std::erase_if(retired_, [](const std::unique_ptr<TranscriptionTask>& t) {
        return t->finished();
    });
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxpaste] {}", msg);
    }
}
