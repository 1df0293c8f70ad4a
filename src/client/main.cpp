#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command>", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  toggle    Start dictation, or stop the one in progress");
    std::println(stderr, "  status    Show daemon state and the last session");
}

static void print_status(const json& response) {
    std::println("State: {}", response.value("state", "unknown"));
    if (!response.contains("last_session")) return;

    auto& last = response["last_session"];
    std::println("Last session #{}: {:.1f}s, {} frames, {} finals, {} partials{}",
                 last.value("id", 0), last.value("duration", 0.0),
                 last.value("frames_sent", 0), last.value("finals", 0),
                 last.value("partials", 0),
                 last.value("deadline_expired", false) ? " (drain timed out)" : "");
    if (last.contains("error")) {
        std::println("  Ended early: {}", last["error"].get<std::string>());
    }
    auto text = last.value("text", "");
    std::println("  Text: {}", text.empty() ? "(none)" : text);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command != "toggle" && command != "status") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }
    json cmd = {{"cmd", command}};

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is keyscribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        print_status(response);
    } else {
        std::println("OK ({} -> {})", response.value("state", "?"),
                     response.value("action", "?"));
    }
    return 0;
}
