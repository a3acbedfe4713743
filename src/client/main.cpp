#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "recorder/recorder_error.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  devices                   List recording devices");
    std::println(stderr, "  init [--device NAME]      Open a recording session");
    std::println(stderr, "  close                     Close the recording session");
    std::println(stderr, "  start                     Start recording");
    std::println(stderr, "  stop [--output FILE]      Stop recording, optionally saving a WAV file");
    std::println(stderr, "  cancel                    Stop recording and discard the audio");
    std::println(stderr, "  toggle [--device NAME] [--output FILE]");
    std::println(stderr, "                            Start recording, or stop if already recording");
    std::println(stderr, "  status                    Show recorder status");
    std::println(stderr, "  shutdown                  Stop the audio worker");
}

static void print_error(const json& response) {
    if (response.contains("error")) {
        try {
            auto err = response["error"].get<RecorderError>();
            std::println(stderr, "Error ({}): {}", to_string(err.kind), err.message());
            return;
        } catch (const std::exception& e) {
            std::println(stderr, "Unreadable error from daemon: {}", e.what());
        }
    }
    std::println(stderr, "Error: {}", response.value("message", "unknown error"));
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string device;
    std::string output;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--device" || arg == "-d") && i + 1 < argc) {
            device = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            output = argv[++i];
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    json cmd;
    if (command == "init") {
        cmd = {{"cmd", "init"}};
        if (!device.empty()) cmd["device"] = device;
    } else if (command == "stop" || command == "toggle") {
        cmd = {{"cmd", command}};
        if (!device.empty()) cmd["device"] = device;
        // The daemon runs from /, so relative paths are resolved here.
        if (!output.empty()) cmd["output"] = std::filesystem::absolute(output).string();
    } else if (command == "devices" || command == "close" || command == "start" ||
               command == "cancel" || command == "status" || command == "shutdown") {
        cmd = {{"cmd", command}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is micgate running?");
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon");
        return 1;
    }

    if (response.value("status", "") != "ok") {
        print_error(response);
        return 1;
    }

    if (command == "devices") {
        for (auto& d : response.value("devices", json::array())) {
            std::println("{}", d.value("label", ""));
        }
    } else if (command == "status") {
        std::println("Worker: {}", response.value("worker", false) ? "running" : "stopped");
        std::println("Recording: {}", response.value("recording", false) ? "yes" : "no");
    } else if (command == "toggle" && response.value("recording", false)) {
        std::println("Recording");
    } else if (command == "stop" || command == "toggle") {
        std::println("Captured {} samples ({:.1f}s)",
                     response.value("sample_count", size_t{0}), response.value("duration", 0.0));
        if (response.contains("path")) {
            std::println("Saved to {}", response["path"].get<std::string>());
        }
    } else {
        std::println("OK");
    }

    return 0;
}
