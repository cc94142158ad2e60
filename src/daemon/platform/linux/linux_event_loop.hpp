#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "insertion/text_inserter.hpp"
#include "level_meter.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/whisper_runner.hpp"
#include "platform/linux/wtype_injector.hpp"
#include "recording_service.hpp"
#include "sample_ring.hpp"
#include "transcription/coordinator.hpp"
#include "transcription/local_backend.hpp"
#include "transcription/remote_backend.hpp"

#include <atomic>
#include <memory>

// epoll loop over signals, IPC, transcription completions and the dismiss
// timer. Owns every component; nothing else is global.
class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_signal();
    void handle_client(int fd);
    void drop_client(int fd);
    void arm_dismiss_timer(int delay_ms);
    void log(const std::string& msg);

    Config initial_;
    ConfigStore config_;
    bool verbose_;

    // Platform implementations and services (constructed before core_)
    SampleRing ring_;
    LevelMeter meter_;
    PipeWireCapture capture_;
    RecordingService recording_;

    std::unique_ptr<Clipboard> clipboard_;
    WtypeInjector keys_;
    TextInserter inserter_;

    WhisperRunner runner_;
    LocalBackend local_backend_;
    RemoteBackend remote_backend_;
    TranscriptionCoordinator coordinator_;

    UnixSocketServer ipc_server_;

    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int dismiss_timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
