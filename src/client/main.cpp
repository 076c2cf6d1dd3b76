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
    std::println(stderr, "  toggle [--wait SECONDS]   Start recording, or stop and process");
    std::println(stderr, "  start                     Start recording");
    std::println(stderr, "  stop [--wait SECONDS]     Stop recording, merge and summarize");
    std::println(stderr, "  status                    Show daemon status");
    std::println(stderr, "  history [--limit N]       Show recent recording cycles");
}

static void print_outcome(const json& response) {
    std::println("Outcome: {}", response.value("outcome", "unknown"));
    if (auto combined = response.value("combined", ""); !combined.empty()) {
        std::println("  Combined transcript: {} ({} segments)", combined, response.value("segments", 0));
    }
    if (auto summary = response.value("summary", ""); !summary.empty()) {
        std::println("  Summary: {}", summary);
    }
    if (response.contains("message")) {
        std::println("  {}", response["message"].get<std::string>());
    }
    if (response.contains("missing")) {
        for (auto& path : response["missing"]) {
            std::println("  Missing: {}", path.get<std::string>());
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;
    // Worst case: both workers hit the stop timeout, then the artifact wait
    // ceiling and the summary request.
    int wait_s = 900;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--wait" && i + 1 < argc) {
            wait_s = std::atoi(argv[++i]);
        }
    }

    json cmd;
    if (command == "toggle" || command == "start" || command == "stop" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is meeting-scribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, wait_s * 1000)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");

    if (command == "status") {
        std::println("State: {} ({})", response.value("state", "unknown"), response.value("label", ""));
        if (auto meeting = response.value("meeting", ""); !meeting.empty()) {
            std::println("Meeting: {}", meeting);
        }
        std::println("Marker: {} ({})", response.value("visible", false) ? "shown" : "hidden",
                     response.value("color", "gray"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {} {}", entry.value("timestamp", ""), entry.value("outcome", ""),
                         entry.value("app", ""));
            if (auto combined = entry.value("combined_path", ""); !combined.empty()) {
                std::println("  Transcript: {}", combined);
            }
            if (auto err = entry.value("error", ""); !err.empty()) {
                std::println("  Error: {}", err);
            }
        }
    } else if (response.contains("outcome")) {
        print_outcome(response);
        return status == "ok" ? 0 : 1;
    } else if (status == "ok") {
        std::println("{}", response.value("state", "OK"));
    } else if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
