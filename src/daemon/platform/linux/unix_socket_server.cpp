#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    std::error_code ec;
    auto parent = std::filesystem::path(endpoint).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    // Remove a stale socket left by a previous run.
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    auto fail = [this](const char* what) {
        std::println(stderr, "ipc: {} failed: {}", what, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    };

    mode_t old_mask = ::umask(0077);
    int rc = ::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::umask(old_mask);
    if (rc < 0) return fail("bind()");
    if (::listen(server_fd_, 8) < 0) return fail("listen()");

    socket_path_ = endpoint;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& [fd, _] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;

    ucred cred{};
    socklen_t len = sizeof(cred);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) < 0 || cred.uid != ::getuid()) {
        std::println(stderr, "ipc: refused connection from uid {}", cred.uid);
        ::close(fd);
        return -1;
    }

    pending_.emplace(fd, std::string{});
    return fd;
}

bool UnixSocketServer::read_commands(int client_fd, std::vector<nlohmann::json>& cmds) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return false;
    auto& buf = it->second;

    bool open = true;
    char chunk[4096];
    while (true) {
        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        open = false;  // closed or failed; still hand over what arrived
        break;
    }

    size_t start = 0;
    for (auto pos = buf.find('\n'); pos != std::string::npos; pos = buf.find('\n', start)) {
        auto line = buf.substr(start, pos - start);
        start = pos + 1;
        if (line.empty()) continue;
        cmds.push_back(nlohmann::json::parse(line, nullptr, false));
        if (cmds.back().is_discarded()) cmds.back() = nullptr;
    }
    buf.erase(0, start);

    if (buf.size() > kMaxLine) {
        std::println(stderr, "ipc: dropping client with oversized command");
        return false;
    }
    return open;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    if (pending_.erase(client_fd) > 0) {
        ::close(client_fd);
    }
}
