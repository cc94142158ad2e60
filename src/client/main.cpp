#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  toggle                      Start recording, or stop and insert");
    std::println(stderr, "  start                       Start recording");
    std::println(stderr, "  stop                        Stop recording and wait for the result");
    std::println(stderr, "  cancel                      Cancel the current session");
    std::println(stderr, "  dismiss                     Dismiss the finished session now");
    std::println(stderr, "  reset                       Force the session back to idle");
    std::println(stderr, "  status                      Show daemon status");
    std::println(stderr, "  validate                    Check the transcription setup");
    std::println(stderr, "  simulate <event> [text]     Drive a mock session");
    std::println(stderr, "      events: hotkey stop started completed failed escape dismiss");
    std::println(stderr, "Options:");
    std::println(stderr, "  --timeout SECONDS           How long stop/toggle wait (default 300)");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int timeout_s = 300;
    std::string event;
    std::string text;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--timeout" && i + 1 < argc) {
            timeout_s = std::atoi(argv[++i]);
        } else if (command == "simulate" && event.empty()) {
            event = arg;
        } else if (command == "simulate") {
            text = text.empty() ? arg : text + " " + arg;
        }
    }

    json cmd;
    if (command == "toggle" || command == "start" || command == "stop" ||
        command == "cancel" || command == "dismiss" || command == "reset" ||
        command == "status" || command == "validate") {
        cmd = {{"cmd", command}};
    } else if (command == "simulate") {
        if (event.empty()) {
            std::println(stderr, "simulate needs an event");
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "simulate"}, {"event", event}, {"text", text}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voxpaste running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // stop (and a stopping toggle) reply only once the session has finished.
    bool may_wait = command == "stop" || command == "toggle";
    int timeout_ms = may_wait ? timeout_s * 1000 : 5000;

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Mode: {}", response.value("mode", "unknown"));
        if (response.contains("message")) {
            std::println("Message: {}", response["message"].get<std::string>());
        }
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("level")) {
            std::println("Level: {:.2f}", response["level"].get<double>());
        }
        if (response.value("mock", false)) std::println("Mock session");
        if (response.contains("last_text")) {
            std::println("Last text: {}", response["last_text"].get<std::string>());
        }
    } else if (status == "ok") {
        if (response.contains("text")) {
            std::println("{}", response["text"].get<std::string>());
        } else if (response.contains("state")) {
            std::println("{}", response["state"].get<std::string>());
        } else {
            std::println("OK");
        }
    } else if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
