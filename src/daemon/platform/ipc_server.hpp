#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Newline-delimited JSON commands from local clients.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;

    // -1 when nothing is pending or the peer was refused.
    virtual int accept_client() = 0;

    // Appends every complete command read from the client. Lines that are not
    // valid JSON come back as null. False once the client has gone away, after
    // appending whatever it sent first.
    virtual bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) = 0;

    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
