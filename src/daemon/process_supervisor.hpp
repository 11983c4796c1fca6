#pragma once

#include "binary_locator.hpp"
#include "child_process.hpp"
#include "config.hpp"
#include "platform/credential_store.hpp"
#include "platform/process_table.hpp"
#include "tool_catalog.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class StartErrorKind {
    BinaryNotFound,  // no candidate path exists
    SpawnFailed,     // started, then exited inside the grace window
    SpawnError,      // pipe/fork/exec failed
    HotkeyConflict,  // trigger key owned by another tool
    Disabled,        // tool is disabled in the config
};

struct StartError {
    StartErrorKind kind;
    std::string message;
};

std::string_view start_error_kind_name(StartErrorKind kind);

struct StopError {
    std::string message;
};

enum class ToolState { Stopped, Running, Error };

struct ToolStatus {
    ToolState state = ToolState::Stopped;
    std::string reason;     // set when state == Error
    int pid = 0;            // set when state == Running
    bool external = false;  // running, but not started by us
    std::chrono::system_clock::time_point since{};  // spawn or first detection
};

std::string_view tool_state_name(ToolState state);

enum class RecordKind { Unmanaged, Owned, External };

struct ScanResult {
    std::vector<ToolId> adopted;  // newly detected external processes
    std::vector<ToolId> lost;     // external processes that disappeared
};

// Argument vector and environment for one launch of `id`.
LaunchCommand build_launch_command(ToolId id, const std::filesystem::path& binary,
                                   const ToolConfig& config,
                                   const std::optional<std::string>& credential);

// Per-tool process state machine:
//   Unmanaged -> Owned    -> Unmanaged   (we spawned it; exit confirmed by waitpid)
//   Unmanaged -> External -> Unmanaged   (seen by a full scan; tracked by PID only)
// A tool is never Owned and External at the same time.
class ProcessSupervisor {
public:
    static constexpr auto kGraceWindow = std::chrono::milliseconds(500);
    static constexpr auto kStopTimeout = std::chrono::milliseconds(500);
    static constexpr auto kPollStep = std::chrono::milliseconds(25);

    ProcessSupervisor(BinaryLocator& locator, ProcessTable& table,
                      CredentialStore& credentials, bool verbose = false);

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Each owned tool's stderr goes to <dir>/<slug>.log, truncated per start.
    // Unset: an anonymous in-memory file that only feeds startup diagnostics.
    void set_log_dir(std::filesystem::path dir);

    std::expected<void, StartError> start(ToolId id, const ToolConfig& config);
    std::expected<void, StopError> stop(ToolId id);

    // Pure read of the current record; never probes the OS.
    ToolStatus status(ToolId id) const;
    RecordKind record_kind(ToolId id) const;

    // Cheap: waitpid(WNOHANG) on owned children only. Returns the tools whose
    // process has exited.
    std::vector<ToolId> reconcile_owned();

    // Expensive: one process-table snapshot to drop dead external records and
    // adopt unmanaged tools that are running.
    ScanResult full_scan();

    // Stops owned tools only; external processes are left alone. Returns the
    // tools that were stopped.
    std::vector<ToolId> stop_all();

private:
    struct OwnedProcess {
        ChildProcess child;
        std::chrono::system_clock::time_point started_at;
    };

    struct ExternalProcess {
        int pid;
        std::chrono::system_clock::time_point detected_at;
    };

    using ProcessRecord = std::variant<OwnedProcess, ExternalProcess>;

    // Drops a record whose process is no longer alive. Returns true if the
    // tool is still running and nothing else needs doing.
    bool still_running_locked(ToolId id);

    std::expected<void, StopError> stop_locked(ToolId id);
    std::expected<void, StopError> stop_owned(ToolId id, OwnedProcess& owned);

    std::expected<void, StartError> spawn_locked(ToolId id, const ToolConfig& config);

    void log(const std::string& msg);

    BinaryLocator& locator_;
    ProcessTable& table_;
    CredentialStore& credentials_;
    bool verbose_;
    std::filesystem::path log_dir_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ToolId, ProcessRecord> records_;
    std::unordered_map<ToolId, std::string> last_errors_;
};
