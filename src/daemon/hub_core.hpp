#pragma once

#include "binary_locator.hpp"
#include "config.hpp"
#include "hotkey_registry.hpp"
#include "platform/credential_store.hpp"
#include "platform/process_table.hpp"
#include "process_supervisor.hpp"
#include "storage/lifecycle_db.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Portable core of the hub daemon: owns the hotkey registry, the supervisor
// and the lifecycle history, and answers IPC commands. Driven from a single
// event-loop thread.
class HubCore {
public:
    HubCore(HubConfig config, std::string config_path, bool verbose,
            BinaryLocator& locator, ProcessTable& table, CredentialStore& credentials);

    HubCore(const HubCore&) = delete;
    HubCore& operator=(const HubCore&) = delete;

    // Registers hotkeys, adopts already-running tools, then auto-starts.
    // An empty history path selects <data_dir>/history.db.
    bool init(const std::string& history_path = {});

    // One request object off the socket; its "cmd" field selects the handler.
    nlohmann::json handle_request(const nlohmann::json& request);

    // Never throws: a field of the wrong JSON type becomes a bad_request reply.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_reconcile_tick();
    void on_scan_tick();

    void shutdown();

    const HubConfig& config() const { return config_; }
    HotkeyRegistry& hotkeys() { return hotkeys_; }
    ProcessSupervisor& supervisor() { return supervisor_; }

    // Enabled check, hotkey pre-flight, then spawn.
    std::expected<void, StartError> start_tool(ToolId id);

private:
    nlohmann::json dispatch(const std::string& cmd_str, const nlohmann::json& cmd);

    nlohmann::json handle_tools(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_stop_all(const nlohmann::json& cmd);
    nlohmann::json handle_scan(const nlohmann::json& cmd);
    nlohmann::json handle_hotkeys(const nlohmann::json& cmd);
    nlohmann::json handle_check_hotkey(const nlohmann::json& cmd);
    nlohmann::json handle_register_hotkey(const nlohmann::json& cmd);
    nlohmann::json handle_unregister_hotkey(const nlohmann::json& cmd);
    nlohmann::json handle_set_hotkey(const nlohmann::json& cmd);
    nlohmann::json handle_set_enabled(const nlohmann::json& cmd, bool enabled);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_key_status(const nlohmann::json& cmd);
    nlohmann::json handle_set_key(const nlohmann::json& cmd);
    nlohmann::json handle_delete_key(const nlohmann::json& cmd);
    nlohmann::json handle_open_settings(const nlohmann::json& cmd);

    // Registers the tool's trigger key unless it already holds it.
    std::expected<void, HotkeyConflict> claim_trigger(ToolId id);
    void release_trigger(ToolId id);

    nlohmann::json status_json(ToolId id) const;
    void record_scan(const ScanResult& result);
    void record(ToolId id, const std::string& event, int pid, const std::string& detail = {});
    void persist();

    void log(const std::string& msg);

    HubConfig config_;
    std::string config_path_;
    bool verbose_;

    BinaryLocator& locator_;
    CredentialStore& credentials_;

    HotkeyRegistry hotkeys_;
    ProcessSupervisor supervisor_;
    LifecycleDb history_db_;

    // Extra instances launched only to raise a running tool's settings window.
    std::vector<ChildProcess> settings_launches_;
};
