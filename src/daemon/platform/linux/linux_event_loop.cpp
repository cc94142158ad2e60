#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/data_control_clipboard.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

std::unique_ptr<Clipboard> open_clipboard(bool verbose) {
    auto data_control = DataControlClipboard::connect(verbose);
    if (data_control) return std::move(*data_control);
    std::println(stderr, "clipboard: {}; falling back to wl-clipboard, "
                         "which restores only one type", data_control.error());
    return std::make_unique<WaylandClipboard>();
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : initial_(std::move(config)),
      config_(initial_, std::move(config_path)),
      verbose_(verbose),
      ring_(initial_.audio.ring_capacity_samples()),
      capture_(ring_, meter_, initial_.audio.sample_rate),
      recording_(capture_, ring_, meter_, initial_.audio.sample_rate, platform::recordings_dir()),
      clipboard_(open_clipboard(verbose_)),
      inserter_(*clipboard_, keys_, verbose_),
      runner_(initial_.local.use_gpu, verbose_),
      local_backend_(runner_, verbose_),
      coordinator_(config_, local_backend_, remote_backend_, verbose_),
      core_(config_, verbose_, recording_, coordinator_, inserter_, ipc_server_,
            // NotifyCallback, runs on the transcription thread
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            },
            // DismissTimer
            [this](int delay_ms) { arm_dismiss_timer(delay_ms); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (dismiss_timer_fd_ >= 0) ::close(dismiss_timer_fd_);
}

bool LinuxEventLoop::init() {
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    if (auto problem = coordinator_.validate_configuration()) {
        std::println(stderr, "Warning: {}", *problem);
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // SIGUSR1 comes from sleep and display-change hooks.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGUSR1);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    dismiss_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (dismiss_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) || !add_fd(dismiss_timer_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                handle_signal();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) > 0) {}
                core_.on_transcription_complete();
                continue;
            }

            if (fd == dismiss_timer_fd_) {
                uint64_t expirations;
                if (::read(dismiss_timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    core_.on_dismiss_timer();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_signal() {
    signalfd_siginfo info;
    while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
        if (info.ssi_signo == SIGUSR1) {
            core_.emergency_reset("SIGUSR1");
            continue;
        }
        log("Received signal, shutting down");
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        auto response = core_.handle_command(cmd);
        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }

    if (!open) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_waiting_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::arm_dismiss_timer(int delay_ms) {
    if (dismiss_timer_fd_ < 0) return;

    itimerspec spec{};
    if (delay_ms > 0) {
        spec.it_value.tv_sec = delay_ms / 1000;
        spec.it_value.tv_nsec = static_cast<long>(delay_ms % 1000) * 1000000L;
    }
    if (timerfd_settime(dismiss_timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxpaste] {}", msg);
    }
}
