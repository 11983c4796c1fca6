#include "hotkey.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <utility>

namespace {

using json = nlohmann::json;

// Indexed by NamedKey; keep in enum order.
constexpr std::array<std::string_view, 66> kKeyNames = {
    "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
    "F13", "F14", "F15", "F16", "F17", "F18", "F19", "F20", "F21", "F22", "F23", "F24",
    "Insert", "Delete", "Home", "End", "PageUp", "PageDown",
    "UpArrow", "DownArrow", "LeftArrow", "RightArrow",
    "Num0", "Num1", "Num2", "Num3", "Num4", "Num5", "Num6", "Num7", "Num8", "Num9",
    "NumLock", "NumpadDivide", "NumpadMultiply", "NumpadSubtract", "NumpadAdd", "NumpadEnter",
    "Escape", "Tab", "CapsLock", "Space", "Backspace", "Return",
    "PrintScreen", "ScrollLock", "Pause",
    "MediaPlayPause", "MediaStop", "MediaPrevious", "MediaNext",
    "VolumeUp", "VolumeDown", "VolumeMute",
};

static_assert(static_cast<size_t>(NamedKey::VolumeMute) + 1 == kKeyNames.size());

constexpr std::array<std::pair<Modifier, std::string_view>, 4> kModifierNames = {{
    {Modifier::Ctrl, "Ctrl"},
    {Modifier::Alt, "Alt"},
    {Modifier::Shift, "Shift"},
    {Modifier::Meta, "Meta"},
}};

std::optional<uint32_t> parse_u32(std::string_view s) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return value;
}

} // namespace

std::vector<Modifier> ModifierSet::list() const {
    std::vector<Modifier> out;
    for (auto& [m, name] : kModifierNames) {
        if (contains(m)) out.push_back(m);
    }
    return out;
}

std::string_view key_name(NamedKey key) {
    return kKeyNames[static_cast<size_t>(key)];
}

std::optional<NamedKey> named_key_from_string(std::string_view name) {
    auto it = std::ranges::find(kKeyNames, name);
    if (it == kKeyNames.end()) return std::nullopt;
    return static_cast<NamedKey>(std::distance(kKeyNames.begin(), it));
}

std::string format_key(const HotkeyKey& key) {
    if (auto* named = std::get_if<NamedKey>(&key)) {
        return std::string(key_name(*named));
    }
    return "#" + std::to_string(std::get<ScanCode>(key).code);
}

std::optional<HotkeyKey> parse_key(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        auto code = parse_u32(text.substr(1));
        if (!code) return std::nullopt;
        return HotkeyKey{ScanCode{*code}};
    }
    auto named = named_key_from_string(text);
    if (!named) return std::nullopt;
    return HotkeyKey{*named};
}

std::string_view modifier_name(Modifier m) {
    for (auto& [mod, name] : kModifierNames) {
        if (mod == m) return name;
    }
    return {};
}

std::optional<Modifier> modifier_from_string(std::string_view name) {
    for (auto& [mod, n] : kModifierNames) {
        if (n == name) return mod;
    }
    return std::nullopt;
}

std::string format_combo(const HotkeyKey& key, const ModifierSet& mods) {
    std::string out;
    for (auto m : mods.list()) {
        out += modifier_name(m);
        out += '+';
    }
    out += format_key(key);
    return out;
}

json key_to_json(const HotkeyKey& key) {
    if (auto* named = std::get_if<NamedKey>(&key)) {
        return {{"type", "Named"}, {"value", std::string(key_name(*named))}};
    }
    return {{"type", "Unknown"}, {"value", std::get<ScanCode>(key).code}};
}

std::optional<uint32_t> scan_code_from_json(const json& j) {
    constexpr auto kMax = std::numeric_limits<uint32_t>::max();
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v > kMax) return std::nullopt;
        return static_cast<uint32_t>(v);
    }
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        if (v < 0 || v > static_cast<int64_t>(kMax)) return std::nullopt;
        return static_cast<uint32_t>(v);
    }
    return std::nullopt;
}

std::optional<HotkeyKey> key_from_json(const json& j) {
    if (j.is_string()) return parse_key(j.get<std::string>());
    if (!j.is_object() || !j.contains("type") || !j.contains("value")) return std::nullopt;
    if (!j["type"].is_string()) return std::nullopt;

    auto type = j["type"].get<std::string>();
    auto& value = j["value"];
    if (type == "Named" && value.is_string()) {
        auto named = named_key_from_string(value.get<std::string>());
        if (!named) return std::nullopt;
        return HotkeyKey{*named};
    }
    if (type == "Unknown") {
        if (auto code = scan_code_from_json(value)) return HotkeyKey{ScanCode{*code}};
    }
    return std::nullopt;
}

json modifiers_to_json(const ModifierSet& mods) {
    auto arr = json::array();
    for (auto m : mods.list()) arr.push_back(std::string(modifier_name(m)));
    return arr;
}

std::optional<ModifierSet> modifiers_from_json(const json& j) {
    ModifierSet mods;
    if (j.is_null()) return mods;
    if (!j.is_array()) return std::nullopt;
    for (auto& item : j) {
        if (!item.is_string()) return std::nullopt;
        auto m = modifier_from_string(item.get<std::string>());
        if (!m) return std::nullopt;
        mods.add(*m);
    }
    return mods;
}

json hotkey_to_json(const RegisteredHotkey& hk) {
    return {
        {"tool_id", std::string(describe(hk.owner).slug)},
        {"action_name", hk.action},
        {"key", key_to_json(hk.key)},
        {"modifiers", modifiers_to_json(hk.modifiers)},
    };
}

std::optional<RegisteredHotkey> hotkey_from_json(const json& j) {
    if (!j.is_object() || !j.contains("tool_id") || !j.contains("key")) return std::nullopt;
    if (!j["tool_id"].is_string()) return std::nullopt;

    auto owner = tool_from_slug(j["tool_id"].get<std::string>());
    auto key = key_from_json(j["key"]);
    auto mods = modifiers_from_json(j.value("modifiers", json()));
    if (!owner || !key || !mods) return std::nullopt;

    return RegisteredHotkey{
        .owner = *owner,
        .action = j.value("action_name", ""),
        .key = *key,
        .modifiers = *mods,
    };
}
