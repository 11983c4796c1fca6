#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--json] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  tools                              List tools with config and status");
    std::println(stderr, "  status [TOOL]                      Show tool status");
    std::println(stderr, "  start TOOL | stop TOOL             Start or stop a tool");
    std::println(stderr, "  stop-all                           Stop every tool the hub started");
    std::println(stderr, "  scan                               Detect tools started outside the hub");
    std::println(stderr, "  enable TOOL | disable TOOL         Toggle a tool");
    std::println(stderr, "  open-settings TOOL                 Open the settings window of desk-talk or typo-fix");
    std::println(stderr, "  hotkeys                            List registered hotkeys");
    std::println(stderr, "  check-hotkey COMBO                 Check whether e.g. Ctrl+F13 is free");
    std::println(stderr, "  register-hotkey TOOL COMBO [--action NAME]");
    std::println(stderr, "  unregister-hotkey COMBO");
    std::println(stderr, "  set-hotkey TOOL KEY                Trigger key, e.g. F13 or #124");
    std::println(stderr, "  history [--limit N]                Show lifecycle events");
    std::println(stderr, "  key-status | set-key [KEY|-] | delete-key");
}

// "Ctrl+Shift+F13" -> key "F13", modifiers ["Ctrl", "Shift"].
static void put_combo(json& cmd, const std::string& combo) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = combo.find('+', start);
        parts.push_back(combo.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    cmd["key"] = parts.back();
    parts.pop_back();
    cmd["modifiers"] = parts;
}

static void print_status(const json& t) {
    auto state = t.value("state", "unknown");
    if (state == "Running") {
        std::println("{:<16} Running (PID {}{})", t.value("tool", ""), t.value("pid", 0),
                     t.value("external", false) ? ", external" : "");
    } else if (state == "Error") {
        std::println("{:<16} Error: {}", t.value("tool", ""), t.value("reason", ""));
    } else {
        std::println("{:<16} {}", t.value("tool", ""), state);
    }
}

int main(int argc, char* argv[]) {
    bool raw = false;
    std::vector<std::string> args;
    int limit = 20;
    std::string action;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json") {
            raw = true;
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--action" && i + 1 < argc) {
            action = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    auto need = [&](size_t n) {
        if (args.size() >= n + 1) return true;
        std::println(stderr, "{}: missing argument", command);
        usage(argv[0]);
        return false;
    };

    json cmd = {{"cmd", command}};
    if (command == "tools" || command == "stop-all" || command == "scan" ||
        command == "hotkeys" || command == "key-status" || command == "delete-key") {
        // no arguments
    } else if (command == "status") {
        if (args.size() > 1) cmd["tool"] = args[1];
    } else if (command == "start" || command == "stop" || command == "enable" ||
               command == "disable" || command == "open-settings") {
        if (!need(1)) return 1;
        cmd["tool"] = args[1];
    } else if (command == "check-hotkey" || command == "unregister-hotkey") {
        if (!need(1)) return 1;
        put_combo(cmd, args[1]);
    } else if (command == "register-hotkey") {
        if (!need(2)) return 1;
        cmd["tool"] = args[1];
        put_combo(cmd, args[2]);
        if (!action.empty()) cmd["action"] = action;
    } else if (command == "set-hotkey") {
        if (!need(2)) return 1;
        cmd["tool"] = args[1];
        cmd["key"] = args[2];
    } else if (command == "history") {
        cmd["limit"] = limit;
    } else if (command == "set-key") {
        // Reading from stdin keeps the secret out of the process list.
        std::string secret;
        if (args.size() > 1 && args[1] != "-") {
            secret = args[1];
        } else {
            std::getline(std::cin, secret);
        }
        cmd["key"] = secret;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (auto conn = client.connect(sock_path); !conn) {
        std::println(stderr, "Failed to connect to hub at {}", sock_path);
        std::println(stderr, "Is toolhubd running?");
        return 1;
    }

    auto reply = client.request(cmd);
    if (!reply) {
        std::println(stderr, "{}", client_error_message(reply.error()));
        return 1;
    }
    json response = std::move(*reply);

    if (raw) {
        std::println("{}", response.dump(2));
        return response.value("status", "") == "ok" ? 0 : 1;
    }

    if (response.value("status", "") != "ok") {
        std::println(stderr, "Error ({}): {}", response.value("kind", "unknown"),
                     response.value("message", "unknown error"));
        return 1;
    }

    if (command == "tools") {
        for (auto& t : response["tools"]) {
            print_status(t);
            std::println("  {}{}", t.value("name", ""), t.value("enabled", true) ? "" : " (disabled)");
            std::println("  binary: {}", t["path"].is_null() ? "not found" : t["path"].get<std::string>());
            if (t["hotkey"].is_string()) {
                std::println("  hotkey: {}", t["hotkey"].get<std::string>());
            } else if (t["special_hotkey"].is_number()) {
                std::println("  hotkey: #{}", t["special_hotkey"].get<uint32_t>());
            }
        }
    } else if (command == "status") {
        if (response.contains("tools")) {
            for (auto& t : response["tools"]) print_status(t);
        } else {
            print_status(response);
        }
    } else if (command == "stop-all") {
        std::println("Stopped: {}", response["stopped"].dump());
    } else if (command == "scan") {
        std::println("Adopted: {}", response["adopted"].dump());
        std::println("Lost:    {}", response["lost"].dump());
    } else if (command == "hotkeys") {
        for (auto& [tool, list] : response["hotkeys"].items()) {
            std::println("{}:", tool);
            for (auto& hk : list) {
                std::println("  {} {} -> {}", hk["modifiers"].dump(), hk["key"].dump(),
                             hk.value("action_name", ""));
            }
        }
    } else if (command == "check-hotkey") {
        if (response.value("available", false)) {
            std::println("{} is available", response.value("combo", ""));
        } else {
            std::println("{}", response.value("message", ""));
            return 1;
        }
    } else if (command == "history") {
        for (auto& e : response["events"]) {
            std::println("[{}] {:<16} {:<12} {}", e.value("timestamp", ""), e.value("tool", ""),
                         e.value("event", ""), e.value("detail", ""));
        }
    } else if (command == "key-status") {
        if (response.value("stored", false)) {
            std::println("API key stored: {}", response.value("preview", ""));
        } else {
            std::println("No API key stored");
        }
    } else {
        if (response.contains("warning")) {
            std::println(stderr, "Warning: {}", response["warning"].get<std::string>());
        }
        std::println("OK");
    }

    return 0;
}
