#pragma once

#include "hotkey.hpp"
#include "tool_catalog.hpp"

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct HotkeyConflict {
    RegisteredHotkey existing;

    // "Hotkey already registered by Speak Selected for action 'Push to talk'"
    std::string message() const;
};

// At most one owner per (key, modifiers). Action label and owner do not take
// part in uniqueness. The entry set is small, so lookups are a linear scan.
class HotkeyRegistry {
public:
    HotkeyRegistry() = default;

    HotkeyRegistry(const HotkeyRegistry&) = delete;
    HotkeyRegistry& operator=(const HotkeyRegistry&) = delete;

    std::expected<void, HotkeyConflict> register_hotkey(ToolId owner, std::string action,
                                                        HotkeyKey key, ModifierSet modifiers);

    // Registers each entry in order; returns the ones rejected as conflicts.
    std::vector<HotkeyConflict> load(const std::vector<RegisteredHotkey>& entries);

    void unregister(const HotkeyKey& key, const ModifierSet& modifiers);
    void unregister_owner(ToolId owner);

    std::optional<RegisteredHotkey> find_conflict(const HotkeyKey& key,
                                                  const ModifierSet& modifiers) const;

    std::vector<RegisteredHotkey> all() const;
    std::vector<RegisteredHotkey> for_owner(ToolId owner) const;
    std::map<ToolId, std::vector<RegisteredHotkey>> by_owner() const;
    size_t size() const;

private:
    const RegisteredHotkey* find_locked(const HotkeyKey& key, const ModifierSet& modifiers) const;

    mutable std::shared_mutex mutex_;
    std::vector<RegisteredHotkey> entries_;
};
