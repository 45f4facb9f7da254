#include "error_text.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                               Start recording");
    std::println(stderr, "  stop [--transcribe]                 Stop recording (and transcribe it)");
    std::println(stderr, "  cancel                              Discard the current recording");
    std::println(stderr, "  transcribe PATH [--language L] [--api-key K]");
    std::println(stderr, "                                      Transcribe an audio file");
    std::println(stderr, "  status                              Show daemon status");
    std::println(stderr, "  settings                            Show transcription settings");
    std::println(stderr, "  set [--provider P] [--model M] [--api-key K] [--language L]");
    std::println(stderr, "                                      Update transcription settings");
    std::println(stderr, "  save-audio --name FILE              Decode base64 from stdin into a temp file");
}

static std::string or_none(const json& v) {
    return v.is_string() ? v.get<std::string>() : "(not set)";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string positional;
    json options = json::object();
    bool then_transcribe = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--transcribe") {
            then_transcribe = true;
        } else if (arg.starts_with("--") && i + 1 < argc) {
            options[arg.substr(2)] = argv[++i];
        } else if (!arg.starts_with("--") && positional.empty()) {
            positional = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is mic-scribed running?");
        return 1;
    }

    auto request = [&client](const json& cmd, int timeout_ms) -> json {
        if (!client.send(cmd)) {
            return {{"status", "error"}, {"message", "failed to send command"}};
        }
        auto reply = client.recv(timeout_ms);
        if (!reply) {
            return {{"status", "error"}, {"message", "no response from daemon: " + reply.error()}};
        }
        return *reply;
    };

    json cmd;
    int timeout_ms = 30000;

    if (command == "start") {
        cmd = {{"cmd", "start"}};
    } else if (command == "stop") {
        cmd = {{"cmd", "stop"}, {"transcribe", then_transcribe}};
        timeout_ms = -1;
    } else if (command == "cancel") {
        cmd = {{"cmd", "cancel"}};
    } else if (command == "transcribe") {
        if (positional.empty()) {
            std::println(stderr, "transcribe: missing PATH");
            return 1;
        }
        // The daemon runs from "/", so relative paths must be resolved here.
        std::error_code ec;
        auto abs = std::filesystem::absolute(positional, ec);
        cmd = {{"cmd", "transcribe"}, {"path", ec ? positional : abs.string()}};
        if (options.contains("language")) cmd["language"] = options["language"];
        if (options.contains("api-key")) cmd["api_key"] = options["api-key"];
        timeout_ms = -1;
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else if (command == "settings") {
        cmd = {{"cmd", "get_settings"}};
    } else if (command == "set") {
        // provider and model are always rewritten, so start from the stored values.
        auto current = request({{"cmd", "get_settings"}}, timeout_ms);
        if (current.value("status", "") != "ok") {
            std::println(stderr, "Error: {}", current.value("message", "unknown error"));
            return 1;
        }
        cmd = {
            {"cmd", "save_settings"},
            {"provider", options.value("provider", current.value("provider", "mistral"))},
            {"model", options.value("model", current.value("model", "voxtral-mini-latest"))},
        };
        if (options.contains("api-key")) cmd["api_key"] = options["api-key"];
        if (options.contains("language")) cmd["language"] = options["language"];
    } else if (command == "save-audio") {
        if (!options.contains("name")) {
            std::println(stderr, "save-audio: missing --name");
            return 1;
        }
        std::string data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        cmd = {{"cmd", "save_audio"}, {"data", data}, {"file_name", options["name"]}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    auto response = request(cmd, timeout_ms);
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "{}", error_text(response));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("path")) {
            std::println("Recording to: {} (pid {})", response["path"].get<std::string>(),
                         response.value("pid", -1));
        }
    } else if (command == "settings") {
        std::println("Provider: {}", response.value("provider", ""));
        std::println("Model:    {}", response.value("model", ""));
        std::println("API key:  {}", response["api_key"].is_string() ? "(set)" : "(not set)");
        std::println("Language: {}", or_none(response["language"]));
    } else if (command == "cancel") {
        std::println("{}", response.value("cancelled", false) ? "Recording cancelled" : "Nothing to cancel");
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.contains("path")) {
        std::println("{}", response["path"].get<std::string>());
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
