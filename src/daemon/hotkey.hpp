#pragma once

#include "tool_catalog.hpp"

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class NamedKey {
    // Function keys
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    F13, F14, F15, F16, F17, F18, F19, F20, F21, F22, F23, F24,

    // Navigation
    Insert, Delete, Home, End, PageUp, PageDown,
    UpArrow, DownArrow, LeftArrow, RightArrow,

    // Numpad
    Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,
    NumLock, NumpadDivide, NumpadMultiply, NumpadSubtract, NumpadAdd, NumpadEnter,

    // Special keys
    Escape, Tab, CapsLock, Space, Backspace, Return,
    PrintScreen, ScrollLock, Pause,

    // Media keys
    MediaPlayPause, MediaStop, MediaPrevious, MediaNext,
    VolumeUp, VolumeDown, VolumeMute,
};

// Platform scan code for a key with no portable name.
struct ScanCode {
    uint32_t code = 0;
    auto operator<=>(const ScanCode&) const = default;
};

// Named keys and scan codes never compare equal, even when they denote the
// same physical key on some platform.
using HotkeyKey = std::variant<NamedKey, ScanCode>;

enum class Modifier : uint8_t { Ctrl = 1, Alt = 2, Shift = 4, Meta = 8 };

class ModifierSet {
public:
    ModifierSet() = default;
    ModifierSet(std::initializer_list<Modifier> mods) {
        for (auto m : mods) add(m);
    }

    void add(Modifier m) { bits_ |= static_cast<uint8_t>(m); }
    bool contains(Modifier m) const { return (bits_ & static_cast<uint8_t>(m)) != 0; }
    bool empty() const { return bits_ == 0; }

    // Modifiers in canonical order (Ctrl, Alt, Shift, Meta).
    std::vector<Modifier> list() const;

    bool operator==(const ModifierSet&) const = default;

private:
    uint8_t bits_ = 0;
};

struct RegisteredHotkey {
    ToolId owner;
    std::string action;
    HotkeyKey key;
    ModifierSet modifiers;
};

std::string_view key_name(NamedKey key);
std::optional<NamedKey> named_key_from_string(std::string_view name);

// "F13" for named keys, "#124" for scan codes.
std::string format_key(const HotkeyKey& key);
std::optional<HotkeyKey> parse_key(std::string_view text);

std::string_view modifier_name(Modifier m);
std::optional<Modifier> modifier_from_string(std::string_view name);

// Human-readable combination, e.g. "Ctrl+Shift+F13".
std::string format_combo(const HotkeyKey& key, const ModifierSet& mods);

// JSON shape shared with the config file:
//   {"tool_id": "speak-selected", "action_name": "...",
//    "key": {"type": "Named", "value": "F13"} | {"type": "Unknown", "value": 124},
//    "modifiers": ["Ctrl", "Shift"]}
nlohmann::json key_to_json(const HotkeyKey& key);
// A JSON integer that fits a scan code; anything else (negative, too large,
// fractional, not a number) is rejected.
std::optional<uint32_t> scan_code_from_json(const nlohmann::json& j);
std::optional<HotkeyKey> key_from_json(const nlohmann::json& j);

nlohmann::json modifiers_to_json(const ModifierSet& mods);
std::optional<ModifierSet> modifiers_from_json(const nlohmann::json& j);

nlohmann::json hotkey_to_json(const RegisteredHotkey& hk);
std::optional<RegisteredHotkey> hotkey_from_json(const nlohmann::json& j);
