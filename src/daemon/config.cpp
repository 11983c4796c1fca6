#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<HotkeyKey> ToolConfig::trigger_key() const {
    if (hotkey) {
        if (auto named = named_key_from_string(*hotkey)) return HotkeyKey{*named};
    }
    if (special_hotkey) return HotkeyKey{ScanCode{*special_hotkey}};
    return std::nullopt;
}

ToolConfig HubConfig::tool(ToolId id) const {
    auto it = tools.find(id);
    return it != tools.end() ? it->second : ToolConfig{};
}

void HubConfig::set_tool(ToolId id, ToolConfig cfg) {
    tools[id] = std::move(cfg);
}

json HubConfig::to_json() const {
    json j = {
        {"auto_start", auto_start},
        {"start_minimized", start_minimized},
        {"dark_mode", dark_mode},
        {"dev_search", dev_search},
        {"stop_tools_on_exit", stop_tools_on_exit},
        {"tools", json::object()},
        {"hotkeys", json::array()},
    };

    for (auto& [id, tc] : tools) {
        json t = {{"enabled", tc.enabled}, {"auto_start", tc.auto_start}};
        t["hotkey"] = tc.hotkey ? json(*tc.hotkey) : json();
        t["special_hotkey"] = tc.special_hotkey ? json(*tc.special_hotkey) : json();
        t["settings"] = tc.settings;
        j["tools"][std::string(describe(id).slug)] = std::move(t);
    }

    for (auto& hk : hotkeys) {
        j["hotkeys"].push_back(hotkey_to_json(hk));
    }
    return j;
}

bool HubConfig::save(const std::string& path) const {
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    // Written aside and renamed over the target.
    auto tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            std::println(stderr, "config: could not write {}", tmp);
            return false;
        }
        f << to_json().dump(2) << '\n';
        f.flush();
        if (!f) {
            std::println(stderr, "config: write to {} failed", tmp);
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::println(stderr, "config: could not replace {}: {}", path, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

HubConfig HubConfig::load(const std::string& path) {
    HubConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("auto_start")) cfg.auto_start = j["auto_start"].get<bool>();
        if (j.contains("start_minimized")) cfg.start_minimized = j["start_minimized"].get<bool>();
        if (j.contains("dark_mode")) cfg.dark_mode = j["dark_mode"].get<bool>();
        if (j.contains("dev_search")) cfg.dev_search = j["dev_search"].get<bool>();
        if (j.contains("stop_tools_on_exit")) cfg.stop_tools_on_exit = j["stop_tools_on_exit"].get<bool>();

        if (j.contains("tools")) {
            for (auto& [slug, t] : j["tools"].items()) {
                auto id = tool_from_slug(slug);
                if (!id) {
                    std::println(stderr, "config: ignoring unknown tool '{}'", slug);
                    continue;
                }

                ToolConfig tc;
                if (t.contains("enabled")) tc.enabled = t["enabled"].get<bool>();
                if (t.contains("auto_start")) tc.auto_start = t["auto_start"].get<bool>();
                if (t.contains("hotkey") && !t["hotkey"].is_null())
                    tc.hotkey = t["hotkey"].get<std::string>();
                if (t.contains("special_hotkey") && !t["special_hotkey"].is_null()) {
                    tc.special_hotkey = scan_code_from_json(t["special_hotkey"]);
                    if (!tc.special_hotkey) {
                        std::println(stderr, "config: ignoring invalid special_hotkey {} for {}",
                                     t["special_hotkey"].dump(), slug);
                    }
                }
                if (t.contains("settings")) tc.settings = t["settings"];
                cfg.tools[*id] = std::move(tc);
            }
        }

        if (j.contains("hotkeys")) {
            for (auto& h : j["hotkeys"]) {
                if (auto hk = hotkey_from_json(h)) {
                    cfg.hotkeys.push_back(std::move(*hk));
                } else {
                    std::println(stderr, "config: ignoring malformed hotkey {}", h.dump());
                }
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return HubConfig{};
    }

    return cfg;
}

HubConfig HubConfig::load_default() {
    auto path = default_path();
    if (path.empty()) return HubConfig{};

    if (fs::exists(path)) {
        return load(path);
    }
    return HubConfig{};
}

std::string HubConfig::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}
