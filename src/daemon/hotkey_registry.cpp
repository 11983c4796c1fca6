#include "hotkey_registry.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <mutex>

std::string HotkeyConflict::message() const {
    return std::format("Hotkey {} already registered by {} for action '{}'",
                       format_combo(existing.key, existing.modifiers),
                       describe(existing.owner).display_name, existing.action);
}

std::expected<void, HotkeyConflict> HotkeyRegistry::register_hotkey(ToolId owner, std::string action,
                                                                    HotkeyKey key, ModifierSet modifiers) {
    std::unique_lock lock(mutex_);
    if (auto* existing = find_locked(key, modifiers)) {
        return std::unexpected(HotkeyConflict{*existing});
    }

    entries_.push_back(RegisteredHotkey{
        .owner = owner,
        .action = std::move(action),
        .key = key,
        .modifiers = modifiers,
    });
    return {};
}

std::vector<HotkeyConflict> HotkeyRegistry::load(const std::vector<RegisteredHotkey>& entries) {
    std::vector<HotkeyConflict> rejected;
    for (auto& e : entries) {
        auto res = register_hotkey(e.owner, e.action, e.key, e.modifiers);
        if (!res) rejected.push_back(std::move(res.error()));
    }
    return rejected;
}

void HotkeyRegistry::unregister(const HotkeyKey& key, const ModifierSet& modifiers) {
    std::unique_lock lock(mutex_);
    std::erase_if(entries_, [&](const RegisteredHotkey& h) {
        return h.key == key && h.modifiers == modifiers;
    });
}

void HotkeyRegistry::unregister_owner(ToolId owner) {
    std::unique_lock lock(mutex_);
    std::erase_if(entries_, [owner](const RegisteredHotkey& h) { return h.owner == owner; });
}

std::optional<RegisteredHotkey> HotkeyRegistry::find_conflict(const HotkeyKey& key,
                                                              const ModifierSet& modifiers) const {
    std::shared_lock lock(mutex_);
    if (auto* existing = find_locked(key, modifiers)) return *existing;
    return std::nullopt;
}

std::vector<RegisteredHotkey> HotkeyRegistry::all() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

std::vector<RegisteredHotkey> HotkeyRegistry::for_owner(ToolId owner) const {
    std::shared_lock lock(mutex_);
    std::vector<RegisteredHotkey> out;
    std::ranges::copy_if(entries_, std::back_inserter(out),
                         [owner](const RegisteredHotkey& h) { return h.owner == owner; });
    return out;
}

std::map<ToolId, std::vector<RegisteredHotkey>> HotkeyRegistry::by_owner() const {
    std::shared_lock lock(mutex_);
    std::map<ToolId, std::vector<RegisteredHotkey>> grouped;
    for (auto& h : entries_) {
        grouped[h.owner].push_back(h);
    }
    return grouped;
}

size_t HotkeyRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

const RegisteredHotkey* HotkeyRegistry::find_locked(const HotkeyKey& key,
                                                    const ModifierSet& modifiers) const {
    auto it = std::ranges::find_if(entries_, [&](const RegisteredHotkey& h) {
        return h.key == key && h.modifiers == modifiers;
    });
    return it != entries_.end() ? &*it : nullptr;
}
