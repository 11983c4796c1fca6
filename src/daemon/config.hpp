#pragma once

#include "hotkey.hpp"
#include "tool_catalog.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ToolConfig {
    bool enabled = true;
    bool auto_start = false;
    std::optional<std::string> hotkey;       // named key, e.g. "F13"
    std::optional<uint32_t> special_hotkey;  // scan code for keys with no name
    nlohmann::json settings;                 // tool-specific, opaque to the hub

    // The trigger key this config selects, named hotkey first.
    std::optional<HotkeyKey> trigger_key() const;
};

struct HubConfig {
    bool auto_start = false;
    bool start_minimized = false;
    bool dark_mode = false;
    bool dev_search = false;         // probe build-output dirs for tool binaries
    bool stop_tools_on_exit = true;  // stop owned tools when the hub shuts down

    std::map<ToolId, ToolConfig> tools;
    std::vector<RegisteredHotkey> hotkeys;

    // Stored config for `id`, or defaults if none.
    ToolConfig tool(ToolId id) const;
    void set_tool(ToolId id, ToolConfig cfg);

    nlohmann::json to_json() const;
    bool save(const std::string& path) const;

    static HubConfig load(const std::string& path);
    static HubConfig load_default();
    static std::string default_path();
};
