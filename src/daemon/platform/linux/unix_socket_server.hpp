#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>

// AF_UNIX stream socket. Only peers running as the daemon's own user are
// accepted.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    static constexpr size_t kMaxLine = 64 * 1024;

private:
    int server_fd_ = -1;
    std::string socket_path_;

    // Partial lines per client.
    std::unordered_map<int, std::string> pending_;
};
