#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

constexpr int kPollMs = 25;

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Runs in the forked child of a multithreaded process: no allocation here.
[[noreturn]] void exec_child(char* const* args, int in_fd, int out_fd, bool quiet) {
    int devnull = ::open("/dev/null", O_RDWR);
    ::dup2(in_fd >= 0 ? in_fd : devnull, STDIN_FILENO);
    ::dup2(out_fd >= 0 ? out_fd : devnull, STDOUT_FILENO);
    if (quiet) ::dup2(devnull, STDERR_FILENO);

    ::execvp(args[0], args);
    ::_exit(127);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const ProcessOptions& opts,
                                                      std::stop_token stop) {
    if (argv.empty()) return std::unexpected(std::string("empty command"));

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));
    if (opts.capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        auto err = errno_message("pipe()");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return std::unexpected(err);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1]}) close_fd(*fd);
        return std::unexpected(err);
    }

    if (pid == 0) {
        // Child. The pipe ends are O_CLOEXEC; dup2 clears the flag on the copies.
        exec_child(args.data(), in_pipe[0], out_pipe[1], opts.quiet);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    ::signal(SIGPIPE, SIG_IGN);

    ProcessResult result;
    bool killed = false;
    auto kill_child = [&] {
        if (!killed) {
            ::kill(pid, SIGTERM);
            killed = true;
            result.stopped = true;
        }
    };

    // Input and output are pumped together so a child that writes while it
    // reads cannot fill one pipe and block on the other.
    bool wrote = true;
    size_t written = 0;
    if (opts.input.empty()) {
        close_fd(in_pipe[1]);
    } else {
        ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
    }

    char buf[4096];
    while (in_pipe[1] >= 0 || out_pipe[0] >= 0) {
        if (stop.stop_requested()) {
            kill_child();
            close_fd(in_pipe[1]);
        }

        pollfd pfds[2];
        nfds_t count = 0;
        int in_idx = -1;
        int out_idx = -1;
        if (in_pipe[1] >= 0) {
            in_idx = static_cast<int>(count);
            pfds[count++] = {in_pipe[1], POLLOUT, 0};
        }
        if (out_pipe[0] >= 0) {
            out_idx = static_cast<int>(count);
            pfds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (count == 0) break;

        int rc = ::poll(pfds, count, kPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        if (in_idx >= 0 && pfds[in_idx].revents != 0) {
            ssize_t n = ::write(in_pipe[1], opts.input.data() + written,
                                opts.input.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                if (written == opts.input.size()) close_fd(in_pipe[1]);
            } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                wrote = false;  // child closed its stdin early
                close_fd(in_pipe[1]);
            }
        }

        if (out_idx >= 0 && pfds[out_idx].revents != 0) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(out_pipe[0]);
            }
        }
    }
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);

    int status = 0;
    while (true) {
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) break;
        if (rc < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid()"));
        }
        if (stop.stop_requested()) kill_child();
        ::usleep(kPollMs * 1000);
    }

    result.exit_code = decode_status(status);
    if (!wrote && !result.stopped && result.exit_code == 0) {
        return std::unexpected(std::string("couldn't write to ") + argv[0]);
    }
    return result;
}

bool find_in_path(const std::string& name) {
    if (name.find('/') != std::string::npos) return ::access(name.c_str(), X_OK) == 0;

    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace platform
