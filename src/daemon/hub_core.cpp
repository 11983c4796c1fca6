#include "hub_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <limits>
#include <map>
#include <print>

using json = nlohmann::json;

namespace {

constexpr int64_t kMaxHistoryLimit = 1000;

json error_response(std::string_view kind, const std::string& message) {
    return {{"status", "error"}, {"kind", std::string(kind)}, {"message", message}};
}

std::expected<ToolId, json> tool_arg(const json& cmd) {
    if (!cmd.contains("tool") || !cmd["tool"].is_string()) {
        return std::unexpected(error_response("bad_request", "missing 'tool'"));
    }
    auto slug = cmd["tool"].get<std::string>();
    auto id = tool_from_slug(slug);
    if (!id) {
        return std::unexpected(error_response("unknown_tool", std::format("unknown tool '{}'", slug)));
    }
    return *id;
}

struct Combo {
    HotkeyKey key;
    ModifierSet modifiers;
};

std::expected<Combo, json> combo_arg(const json& cmd) {
    if (!cmd.contains("key")) {
        return std::unexpected(error_response("bad_request", "missing 'key'"));
    }
    auto key = key_from_json(cmd["key"]);
    if (!key) {
        return std::unexpected(error_response("bad_request", std::format("invalid key {}", cmd["key"].dump())));
    }
    auto mods = modifiers_from_json(cmd.value("modifiers", json()));
    if (!mods) {
        return std::unexpected(error_response("bad_request", "invalid modifiers"));
    }
    return Combo{*key, *mods};
}

json slug_list(const std::vector<ToolId>& ids) {
    auto arr = json::array();
    for (auto id : ids) arr.push_back(std::string(describe(id).slug));
    return arr;
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 10) return std::string(secret.size(), '*');
    return secret.substr(0, 3) + "..." + secret.substr(secret.size() - 4);
}

} // namespace

HubCore::HubCore(HubConfig config, std::string config_path, bool verbose,
                 BinaryLocator& locator, ProcessTable& table, CredentialStore& credentials)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      locator_(locator), credentials_(credentials),
      supervisor_(locator, table, credentials, verbose) {}

bool HubCore::init(const std::string& history_path) {
    auto db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = data.empty() ? "/tmp/toolhub/history.db" : data + "/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }
    supervisor_.set_log_dir(std::filesystem::path(db_path).parent_path() / "logs");

    // Hotkeys of disabled tools stay in the config but are not claimed.
    std::vector<RegisteredHotkey> entries;
    for (auto& hk : config_.hotkeys) {
        if (config_.tool(hk.owner).enabled) entries.push_back(hk);
    }
    for (auto& conflict : hotkeys_.load(entries)) {
        std::println(stderr, "hotkeys: {}", conflict.message());
    }
    for (auto id : all_tools()) {
        if (!config_.tool(id).enabled) continue;
        if (auto res = claim_trigger(id); !res) {
            std::println(stderr, "hotkeys: {}: {}", describe(id).display_name, res.error().message());
        }
    }
    log(std::format("{} hotkeys registered", hotkeys_.size()));

    record_scan(supervisor_.full_scan());

    bool have_credential = credentials_.load().has_value();
    for (auto id : all_tools()) {
        auto cfg = config_.tool(id);
        if (!cfg.enabled || !cfg.auto_start) continue;

        const auto& desc = describe(id);
        if (desc.requires_credential && !have_credential) {
            log(std::format("Skipping auto-start of {}: no API key stored", desc.display_name));
            continue;
        }
        if (supervisor_.status(id).state == ToolState::Running) continue;

        if (auto res = start_tool(id); !res) {
            std::println(stderr, "toolhub: auto-start of {} failed: {}", desc.display_name, res.error().message);
        }
    }

    return true;
}

json HubCore::handle_request(const json& request) {
    if (!request.contains("cmd") || !request["cmd"].is_string()) {
        return error_response("bad_request", "missing 'cmd'");
    }
    return handle_command(request["cmd"].get<std::string>(), request);
}

json HubCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        return dispatch(cmd_str, cmd);
    } catch (const json::exception& e) {
        log(std::format("Rejected '{}': {}", cmd_str, e.what()));
        return error_response("bad_request", e.what());
    }
}

json HubCore::dispatch(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "tools") return handle_tools(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "stop-all") return handle_stop_all(cmd);
    if (cmd_str == "scan") return handle_scan(cmd);
    if (cmd_str == "hotkeys") return handle_hotkeys(cmd);
    if (cmd_str == "check-hotkey") return handle_check_hotkey(cmd);
    if (cmd_str == "register-hotkey") return handle_register_hotkey(cmd);
    if (cmd_str == "unregister-hotkey") return handle_unregister_hotkey(cmd);
    if (cmd_str == "set-hotkey") return handle_set_hotkey(cmd);
    if (cmd_str == "enable") return handle_set_enabled(cmd, true);
    if (cmd_str == "disable") return handle_set_enabled(cmd, false);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "key-status") return handle_key_status(cmd);
    if (cmd_str == "set-key") return handle_set_key(cmd);
    if (cmd_str == "delete-key") return handle_delete_key(cmd);
    if (cmd_str == "open-settings") return handle_open_settings(cmd);
    return error_response("unknown_command", "unknown command");
}

std::expected<void, StartError> HubCore::start_tool(ToolId id) {
    const auto& desc = describe(id);
    auto cfg = config_.tool(id);

    if (!cfg.enabled) {
        return std::unexpected(StartError{
            StartErrorKind::Disabled,
            std::format("{} is disabled", desc.display_name),
        });
    }

    // A tool never starts with a trigger key another tool owns.
    if (auto claim = claim_trigger(id); !claim) {
        auto msg = claim.error().message();
        record(id, "start_failed", 0, msg);
        return std::unexpected(StartError{StartErrorKind::HotkeyConflict, msg});
    }

    auto before = supervisor_.status(id);
    auto res = supervisor_.start(id, cfg);
    if (!res) {
        record(id, "start_failed", 0, res.error().message);
        return res;
    }

    auto after = supervisor_.status(id);
    if (before.state != ToolState::Running || before.pid != after.pid) {
        record(id, "started", after.pid);
    }
    return {};
}

void HubCore::on_reconcile_tick() {
    for (auto id : supervisor_.reconcile_owned()) {
        log(std::format("{} exited", describe(id).display_name));
        record(id, "exited", 0);
    }

    std::erase_if(settings_launches_, [](ChildProcess& c) {
        auto r = c.try_wait();
        return !r || r->has_value();
    });
}

void HubCore::on_scan_tick() {
    record_scan(supervisor_.full_scan());
}

void HubCore::shutdown() {
    if (!config_.stop_tools_on_exit) {
        log("Leaving tools running");
        return;
    }

    std::map<ToolId, int> pids;
    for (auto id : all_tools()) pids[id] = supervisor_.status(id).pid;

    for (auto id : supervisor_.stop_all()) {
        record(id, "stopped", pids[id], "hub shutdown");
    }
}

json HubCore::handle_tools(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"tools", json::array()}};
    for (auto id : all_tools()) {
        const auto& desc = describe(id);
        auto cfg = config_.tool(id);

        json t = status_json(id);
        t["name"] = std::string(desc.display_name);
        t["description"] = std::string(desc.description);
        t["binary"] = executable_name(id);
        t["requires_key"] = desc.requires_credential;
        t["enabled"] = cfg.enabled;
        t["auto_start"] = cfg.auto_start;
        t["hotkey"] = cfg.hotkey ? json(*cfg.hotkey) : json();
        t["special_hotkey"] = cfg.special_hotkey ? json(*cfg.special_hotkey) : json();

        auto path = locator_.locate(id);
        t["path"] = path ? json(path->string()) : json();

        resp["tools"].push_back(std::move(t));
    }
    return resp;
}

json HubCore::handle_status(const json& cmd) {
    if (cmd.contains("tool")) {
        auto id = tool_arg(cmd);
        if (!id) return id.error();
        json resp = status_json(*id);
        resp["status"] = "ok";
        return resp;
    }

    json resp = {{"status", "ok"}, {"tools", json::array()}};
    for (auto id : all_tools()) resp["tools"].push_back(status_json(id));
    return resp;
}

json HubCore::handle_start(const json& cmd) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();

    if (auto res = start_tool(*id); !res) {
        log(std::format("Start of {} failed: {}", describe(*id).display_name, res.error().message));
        return error_response(start_error_kind_name(res.error().kind), res.error().message);
    }

    json resp = status_json(*id);
    resp["status"] = "ok";
    return resp;
}

json HubCore::handle_stop(const json& cmd) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();

    auto before = supervisor_.status(*id);
    auto res = supervisor_.stop(*id);
    if (before.state == ToolState::Running) {
        record(*id, "stopped", before.pid, res ? "" : res.error().message);
    }
    if (!res) {
        std::println(stderr, "supervisor: {}", res.error().message);
        return error_response("stop_failed", res.error().message);
    }
    return {{"status", "ok"}, {"tool", std::string(describe(*id).slug)}};
}

json HubCore::handle_stop_all(const json& /*cmd*/) {
    std::map<ToolId, int> pids;
    for (auto id : all_tools()) pids[id] = supervisor_.status(id).pid;

    auto stopped = supervisor_.stop_all();
    for (auto id : stopped) record(id, "stopped", pids[id]);
    return {{"status", "ok"}, {"stopped", slug_list(stopped)}};
}

json HubCore::handle_scan(const json& /*cmd*/) {
    auto result = supervisor_.full_scan();
    record_scan(result);
    return {
        {"status", "ok"},
        {"adopted", slug_list(result.adopted)},
        {"lost", slug_list(result.lost)},
    };
}

json HubCore::handle_hotkeys(const json& /*cmd*/) {
    json grouped = json::object();
    for (auto& [owner, list] : hotkeys_.by_owner()) {
        auto arr = json::array();
        for (auto& hk : list) arr.push_back(hotkey_to_json(hk));
        grouped[std::string(describe(owner).slug)] = std::move(arr);
    }
    return {{"status", "ok"}, {"hotkeys", std::move(grouped)}};
}

json HubCore::handle_check_hotkey(const json& cmd) {
    auto combo = combo_arg(cmd);
    if (!combo) return combo.error();

    json resp = {
        {"status", "ok"},
        {"combo", format_combo(combo->key, combo->modifiers)},
    };
    if (auto existing = hotkeys_.find_conflict(combo->key, combo->modifiers)) {
        resp["available"] = false;
        resp["conflict"] = hotkey_to_json(*existing);
        resp["message"] = HotkeyConflict{*existing}.message();
    } else {
        resp["available"] = true;
    }
    return resp;
}

json HubCore::handle_register_hotkey(const json& cmd) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();
    auto combo = combo_arg(cmd);
    if (!combo) return combo.error();

    std::string action(describe(*id).hotkey_action);
    if (cmd.contains("action")) {
        if (!cmd["action"].is_string() || cmd["action"].get<std::string>().empty()) {
            return error_response("bad_request", "'action' must be a non-empty string");
        }
        action = cmd["action"].get<std::string>();
    }

    auto res = hotkeys_.register_hotkey(*id, action, combo->key, combo->modifiers);
    if (!res) {
        auto resp = error_response("hotkey_conflict", res.error().message());
        resp["existing"] = hotkey_to_json(res.error().existing);
        return resp;
    }

    config_.hotkeys.push_back(RegisteredHotkey{
        .owner = *id,
        .action = action,
        .key = combo->key,
        .modifiers = combo->modifiers,
    });
    persist();

    log(std::format("Registered {} for {}", format_combo(combo->key, combo->modifiers),
                    describe(*id).display_name));
    return {{"status", "ok"}, {"combo", format_combo(combo->key, combo->modifiers)}};
}

json HubCore::handle_unregister_hotkey(const json& cmd) {
    auto combo = combo_arg(cmd);
    if (!combo) return combo.error();

    bool existed = hotkeys_.find_conflict(combo->key, combo->modifiers).has_value();
    hotkeys_.unregister(combo->key, combo->modifiers);

    auto erased = std::erase_if(config_.hotkeys, [&](const RegisteredHotkey& hk) {
        return hk.key == combo->key && hk.modifiers == combo->modifiers;
    });
    if (erased > 0) persist();

    return {{"status", "ok"}, {"removed", existed}};
}

json HubCore::handle_set_hotkey(const json& cmd) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();

    std::optional<HotkeyKey> key;
    if (cmd.contains("special")) {
        auto code = scan_code_from_json(cmd["special"]);
        if (!code) {
            return error_response("bad_request",
                                  std::format("'special' must be a scan code between 0 and {}",
                                              std::numeric_limits<uint32_t>::max()));
        }
        key = HotkeyKey{ScanCode{*code}};
    } else if (cmd.contains("key")) {
        key = key_from_json(cmd["key"]);
        if (!key) return error_response("bad_request", std::format("invalid key {}", cmd["key"].dump()));
    } else {
        return error_response("bad_request", "missing 'key' or 'special'");
    }

    if (auto existing = hotkeys_.find_conflict(*key, {}); existing && existing->owner != *id) {
        auto resp = error_response("hotkey_conflict", HotkeyConflict{*existing}.message());
        resp["existing"] = hotkey_to_json(*existing);
        return resp;
    }

    release_trigger(*id);

    auto cfg = config_.tool(*id);
    if (auto* named = std::get_if<NamedKey>(&*key)) {
        cfg.hotkey = std::string(key_name(*named));
        cfg.special_hotkey.reset();
    } else {
        cfg.hotkey.reset();
        cfg.special_hotkey = std::get<ScanCode>(*key).code;
    }
    config_.set_tool(*id, cfg);

    if (cfg.enabled) {
        if (auto res = claim_trigger(*id); !res) {
            std::println(stderr, "hotkeys: {}", res.error().message());
        }
    }
    persist();

    return {
        {"status", "ok"},
        {"tool", std::string(describe(*id).slug)},
        {"key", format_key(*key)},
        {"restart_required", supervisor_.status(*id).state == ToolState::Running},
    };
}

json HubCore::handle_set_enabled(const json& cmd, bool enabled) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();

    auto cfg = config_.tool(*id);
    cfg.enabled = enabled;
    config_.set_tool(*id, cfg);

    json resp = {{"status", "ok"}, {"tool", std::string(describe(*id).slug)}, {"enabled", enabled}};

    if (enabled) {
        for (auto& hk : config_.hotkeys) {
            if (hk.owner != *id) continue;
            if (auto held = hotkeys_.find_conflict(hk.key, hk.modifiers); held && held->owner == *id) continue;
            if (auto res = hotkeys_.register_hotkey(hk.owner, hk.action, hk.key, hk.modifiers); !res) {
                std::println(stderr, "hotkeys: {}", res.error().message());
            }
        }
        if (auto res = claim_trigger(*id); !res) {
            resp["warning"] = res.error().message();
        }
    } else {
        hotkeys_.unregister_owner(*id);

        auto before = supervisor_.status(*id);
        auto res = supervisor_.stop(*id);
        if (before.state == ToolState::Running) {
            record(*id, "stopped", before.pid, "disabled");
        }
        if (!res) {
            std::println(stderr, "supervisor: {}", res.error().message);
            resp["warning"] = res.error().message;
        }
    }

    persist();
    return resp;
}

json HubCore::handle_history(const json& cmd) {
    int limit = 20;
    if (cmd.contains("limit")) {
        auto& l = cmd["limit"];
        if (!l.is_number_integer() || l.get<int64_t>() < 1 || l.get<int64_t>() > kMaxHistoryLimit) {
            return error_response("bad_request",
                                  std::format("'limit' must be an integer from 1 to {}", kMaxHistoryLimit));
        }
        limit = l.get<int>();
    }
    auto events = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"events", json::array()}};
    for (auto& e : events) {
        resp["events"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"tool", e.tool},
            {"event", e.event},
            {"pid", e.pid},
            {"detail", e.detail},
        });
    }
    return resp;
}

json HubCore::handle_key_status(const json& /*cmd*/) {
    auto secret = credentials_.load();
    json resp = {{"status", "ok"}, {"stored", secret.has_value()}};
    resp["preview"] = secret ? json(mask_secret(*secret)) : json();
    return resp;
}

json HubCore::handle_set_key(const json& cmd) {
    if (!cmd.contains("key") || !cmd["key"].is_string()) {
        return error_response("bad_request", "missing 'key'");
    }
    if (auto res = credentials_.save(cmd["key"].get<std::string>()); !res) {
        return error_response("credential", res.error());
    }
    log("API key stored");
    return {{"status", "ok"}};
}

json HubCore::handle_delete_key(const json& /*cmd*/) {
    if (auto res = credentials_.remove(); !res) {
        return error_response("credential", res.error());
    }
    log("API key removed");
    return {{"status", "ok"}};
}

json HubCore::handle_open_settings(const json& cmd) {
    auto id = tool_arg(cmd);
    if (!id) return id.error();

    const auto& desc = describe(*id);
    if (!desc.own_config) {
        return error_response("no_settings", std::format("{} has no settings window", desc.slug));
    }

    json resp = {{"status", "ok"}, {"tool", std::string(desc.slug)}};

    // Not running: a normal start, which opens its window.
    if (supervisor_.status(*id).state != ToolState::Running) {
        if (auto res = start_tool(*id); !res) {
            return error_response(start_error_kind_name(res.error().kind), res.error().message);
        }
        resp["action"] = "started";
        return resp;
    }

    // Running: a second launch hands over to the single instance, which
    // raises its settings window and exits.
    auto binary = locator_.locate(*id);
    if (!binary) {
        return error_response(start_error_kind_name(StartErrorKind::BinaryNotFound),
                              std::format("Could not find binary for {}", desc.display_name));
    }
    auto child = ChildProcess::spawn({.path = *binary});
    if (!child) {
        return error_response(start_error_kind_name(StartErrorKind::SpawnError), child.error());
    }
    child->release_stderr();
    log(std::format("Asked running {} for its settings window (PID {})", desc.display_name, child->pid()));
    settings_launches_.push_back(std::move(*child));

    resp["action"] = "forwarded";
    return resp;
}

std::expected<void, HotkeyConflict> HubCore::claim_trigger(ToolId id) {
    const auto& desc = describe(id);
    if (desc.own_config) return {};
    if (desc.hotkey_flag.empty() && desc.special_hotkey_flag.empty()) return {};

    auto key = config_.tool(id).trigger_key();
    if (!key) return {};

    if (auto existing = hotkeys_.find_conflict(*key, {})) {
        if (existing->owner == id) return {};
        return std::unexpected(HotkeyConflict{*existing});
    }
    return hotkeys_.register_hotkey(id, std::string(desc.hotkey_action), *key, {});
}

void HubCore::release_trigger(ToolId id) {
    auto key = config_.tool(id).trigger_key();
    if (!key) return;

    if (auto existing = hotkeys_.find_conflict(*key, {}); existing && existing->owner == id) {
        hotkeys_.unregister(*key, {});
    }
}

json HubCore::status_json(ToolId id) const {
    auto st = supervisor_.status(id);
    json j = {
        {"tool", std::string(describe(id).slug)},
        {"state", std::string(tool_state_name(st.state))},
    };
    if (st.state == ToolState::Running) {
        j["pid"] = st.pid;
        j["external"] = st.external;
        auto up = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - st.since);
        j["uptime_s"] = std::max<int64_t>(0, up.count());
    } else if (st.state == ToolState::Error) {
        j["reason"] = st.reason;
    }
    return j;
}

void HubCore::record_scan(const ScanResult& result) {
    for (auto id : result.adopted) {
        record(id, "adopted", supervisor_.status(id).pid);
    }
    for (auto id : result.lost) {
        record(id, "lost", 0);
    }
}

void HubCore::record(ToolId id, const std::string& event, int pid, const std::string& detail) {
    if (!history_db_.is_open()) return;
    if (!history_db_.insert(std::string(describe(id).slug), event, pid, detail)) {
        log(std::format("Could not record '{}' for {}", event, describe(id).display_name));
    }
}

void HubCore::persist() {
    if (config_path_.empty()) return;
    if (!config_.save(config_path_)) {
        std::println(stderr, "config: failed to save {}", config_path_);
    }
}

void HubCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolhub] {}", msg);
    }
}
