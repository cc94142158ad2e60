#pragma once

#include "config.hpp"
#include "insertion/text_inserter.hpp"
#include "platform/ipc_server.hpp"
#include "recording_service.hpp"
#include "state_machine.hpp"
#include "transcription/coordinator.hpp"
#include "transcription/transcription_task.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Owns the dictation session: feeds IPC commands, timers and transcription
// results into the state machine and carries out its callbacks.
//
// Everything except the notify callback runs on the event loop thread.
class DaemonCore : public SessionDelegate {
public:
    // Called from a transcription worker when its result is ready.
    using NotifyCallback = std::function<void()>;
    // Arms the dismiss timer for `delay_ms`, or disarms it when <= 0.
    using DismissTimer = std::function<void(int delay_ms)>;

    DaemonCore(ConfigStore& config, bool verbose,
               RecordingService& recording, TranscriptionCoordinator& coordinator,
               TextInserter& inserter, IpcServer& ipc,
               NotifyCallback notify, DismissTimer dismiss_timer);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // A response with status "transcribing" means the reply is deferred: the
    // caller registers the client with add_waiting_client().
    nlohmann::json handle_command(const nlohmann::json& cmd);

    void on_transcription_complete();
    void on_dismiss_timer();

    // OS interruption (sleep, display change): clean up and snap to idle.
    void emergency_reset(const std::string& reason);

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    const SessionState& session_state() const { return machine_.state(); }
    bool panel_visible() const { return panel_visible_; }

    void shutdown();

    // SessionDelegate
    void on_show_panel() override;
    void on_hide_panel() override;
    void on_start_recording() override;
    void on_stop_recording() override;
    void on_cancel() override;
    InsertionResult on_insert_text(const std::string& text) override;

private:
    nlohmann::json handle_toggle();
    nlohmann::json handle_start();
    nlohmann::json handle_stop();
    nlohmann::json handle_cancel();
    nlohmann::json handle_status();
    nlohmann::json handle_validate();
    nlohmann::json handle_simulate(const nlohmann::json& cmd);

    void dispatch(SessionEvent event);
    void after_transition();
    nlohmann::json state_response() const;
    nlohmann::json stop_response() const;

    void cancel_task();
    void reap_retired();

    void log(const std::string& msg);

    ConfigStore& config_;
    bool verbose_;

    RecordingService& recording_;
    TranscriptionCoordinator& coordinator_;
    TextInserter& inserter_;
    IpcServer& ipc_;

    NotifyCallback notify_;
    DismissTimer dismiss_timer_;

    DictationStateMachine machine_;

    std::unique_ptr<TranscriptionTask> task_;
    // Cancelled tasks still running; destroying one would block on its join.
    std::vector<std::unique_ptr<TranscriptionTask>> retired_;

    bool panel_visible_ = false;
    bool dismiss_armed_ = false;
    std::string last_text_;
    std::vector<int> waiting_clients_;
};
