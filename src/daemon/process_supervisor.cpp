#include "process_supervisor.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>
#include <print>
#include <signal.h>
#include <sstream>
#include <thread>

namespace {

constexpr size_t kDiagnosticLines = 5;

std::string scan_name(ToolId id) {
    auto name = executable_name(id);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

// First few non-empty lines of captured stderr.
std::string first_lines(const std::string& text, size_t max_lines) {
    std::istringstream in(text);
    std::string line, out;
    size_t count = 0;
    while (count < max_lines && std::getline(in, line)) {
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
        if (line.empty()) continue;
        if (!out.empty()) out += '\n';
        out += line;
        ++count;
    }
    return out;
}

} // namespace

std::string_view start_error_kind_name(StartErrorKind kind) {
    switch (kind) {
        case StartErrorKind::BinaryNotFound: return "binary_not_found";
        case StartErrorKind::SpawnFailed: return "spawn_failed";
        case StartErrorKind::SpawnError: return "spawn_error";
        case StartErrorKind::HotkeyConflict: return "hotkey_conflict";
        case StartErrorKind::Disabled: return "disabled";
    }
    return "unknown";
}

std::string_view tool_state_name(ToolState state) {
    switch (state) {
        case ToolState::Stopped: return "Stopped";
        case ToolState::Running: return "Running";
        case ToolState::Error: return "Error";
    }
    return "Unknown";
}

LaunchCommand build_launch_command(ToolId id, const std::filesystem::path& binary,
                                   const ToolConfig& config,
                                   const std::optional<std::string>& credential) {
    const auto& desc = describe(id);

    LaunchCommand cmd;
    cmd.path = binary;

    if (desc.requires_credential && credential && !credential->empty()) {
        cmd.env.emplace_back(std::string(kCredentialEnvVar), *credential);
    }

    // GUI tools read their hotkeys from their own settings.
    if (desc.own_config) return cmd;

    if (config.hotkey && !config.hotkey->empty()) {
        if (!desc.hotkey_flag.empty()) {
            cmd.args.emplace_back(desc.hotkey_flag);
            cmd.args.push_back(*config.hotkey);
        }
    } else if (config.special_hotkey) {
        if (!desc.special_hotkey_flag.empty()) {
            cmd.args.emplace_back(desc.special_hotkey_flag);
            cmd.args.push_back(std::to_string(*config.special_hotkey));
        }
    }

    return cmd;
}

ProcessSupervisor::ProcessSupervisor(BinaryLocator& locator, ProcessTable& table,
                                     CredentialStore& credentials, bool verbose)
    : locator_(locator), table_(table), credentials_(credentials), verbose_(verbose) {}

void ProcessSupervisor::set_log_dir(std::filesystem::path dir) {
    std::unique_lock lock(mutex_);
    log_dir_ = std::move(dir);
}

std::expected<void, StartError> ProcessSupervisor::start(ToolId id, const ToolConfig& config) {
    std::unique_lock lock(mutex_);

    if (still_running_locked(id)) {
        log(std::format("{} already running", describe(id).display_name));
        last_errors_.erase(id);
        return {};
    }

    auto res = spawn_locked(id, config);
    if (res) {
        last_errors_.erase(id);
    } else {
        last_errors_[id] = res.error().message;
    }
    return res;
}

std::expected<void, StopError> ProcessSupervisor::stop(ToolId id) {
    std::unique_lock lock(mutex_);
    last_errors_.erase(id);
    return stop_locked(id);
}

ToolStatus ProcessSupervisor::status(ToolId id) const {
    std::shared_lock lock(mutex_);

    ToolStatus st;
    if (auto it = records_.find(id); it != records_.end()) {
        st.state = ToolState::Running;
        if (auto* owned = std::get_if<OwnedProcess>(&it->second)) {
            st.pid = owned->child.pid();
            st.since = owned->started_at;
        } else {
            auto& ext = std::get<ExternalProcess>(it->second);
            st.pid = ext.pid;
            st.since = ext.detected_at;
            st.external = true;
        }
        return st;
    }

    if (auto it = last_errors_.find(id); it != last_errors_.end()) {
        st.state = ToolState::Error;
        st.reason = it->second;
    }
    return st;
}

RecordKind ProcessSupervisor::record_kind(ToolId id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return RecordKind::Unmanaged;
    return std::holds_alternative<OwnedProcess>(it->second) ? RecordKind::Owned : RecordKind::External;
}

std::vector<ToolId> ProcessSupervisor::reconcile_owned() {
    std::unique_lock lock(mutex_);

    std::vector<ToolId> exited;
    for (auto it = records_.begin(); it != records_.end();) {
        auto* owned = std::get_if<OwnedProcess>(&it->second);
        if (!owned) {
            ++it;
            continue;
        }

        auto r = owned->child.try_wait();
        if (r && !r->has_value()) {
            ++it;
            continue;
        }

        // A failed liveness check counts as exited.
        if (!r) {
            log(std::format("{}: liveness check failed ({}), treating as stopped",
                            describe(it->first).display_name, r.error()));
        } else {
            log(std::format("{} exited: {}", describe(it->first).display_name, (*r)->describe()));
        }
        exited.push_back(it->first);
        it = records_.erase(it);
    }
    return exited;
}

ScanResult ProcessSupervisor::full_scan() {
    std::unique_lock lock(mutex_);

    auto snap = table_.snapshot();
    ScanResult result;

    for (auto it = records_.begin(); it != records_.end();) {
        auto* ext = std::get_if<ExternalProcess>(&it->second);
        if (ext && !snap.contains(scan_name(it->first), ext->pid)) {
            log(std::format("{} (external, PID {}) no longer running",
                            describe(it->first).display_name, ext->pid));
            result.lost.push_back(it->first);
            it = records_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto id : all_tools()) {
        if (records_.contains(id)) continue;

        if (auto pid = snap.find(scan_name(id))) {
            log(std::format("Detected already-running {}: PID {}", describe(id).display_name, *pid));
            records_.emplace(id, ExternalProcess{*pid, std::chrono::system_clock::now()});
            last_errors_.erase(id);
            result.adopted.push_back(id);
        }
    }

    return result;
}

std::vector<ToolId> ProcessSupervisor::stop_all() {
    std::unique_lock lock(mutex_);

    std::vector<ToolId> owned;
    for (auto& [id, record] : records_) {
        if (std::holds_alternative<OwnedProcess>(record)) owned.push_back(id);
    }

    for (auto id : owned) {
        last_errors_.erase(id);
        if (auto res = stop_locked(id); !res) {
            std::println(stderr, "supervisor: {}", res.error().message);
        }
    }
    return owned;
}

bool ProcessSupervisor::still_running_locked(ToolId id) {
    auto it = records_.find(id);
    if (it == records_.end()) return false;

    if (auto* owned = std::get_if<OwnedProcess>(&it->second)) {
        auto r = owned->child.try_wait();
        if (r && !r->has_value()) return true;
        if (!r) {
            log(std::format("{}: liveness check failed ({}), restarting",
                            describe(id).display_name, r.error()));
        }
        records_.erase(it);
        return false;
    }

    // External records are re-validated against the OS, never trusted.
    auto pid = std::get<ExternalProcess>(it->second).pid;
    if (table_.is_running(pid)) return true;

    records_.erase(it);
    return false;
}

std::expected<void, StartError> ProcessSupervisor::spawn_locked(ToolId id, const ToolConfig& config) {
    const auto& desc = describe(id);

    auto binary = locator_.locate(id);
    if (!binary) {
        return std::unexpected(StartError{
            StartErrorKind::BinaryNotFound,
            std::format("Could not find binary for {}", desc.display_name),
        });
    }

    std::optional<std::string> credential;
    if (desc.requires_credential) credential = credentials_.load();

    auto cmd = build_launch_command(id, *binary, config, credential);
    if (!log_dir_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir_, ec);
        if (ec) {
            std::println(stderr, "supervisor: cannot create {}: {}", log_dir_.string(), ec.message());
        } else {
            cmd.stderr_log = log_dir_ / (std::string(desc.slug) + ".log");
        }
    }
    log(std::format("Starting {} from {}", desc.display_name, binary->string()));
    if (!cmd.args.empty()) {
        log(std::format("  Passing hotkey: {} {}", cmd.args[0], cmd.args[1]));
    }

    auto spawned = ChildProcess::spawn(cmd);
    if (!spawned) {
        return std::unexpected(StartError{
            StartErrorKind::SpawnError,
            std::format("Failed to spawn {}: {}", desc.display_name, spawned.error()),
        });
    }
    auto child = std::move(*spawned);

    // Grace window: a tool that dies right away is reported, not recorded.
    auto deadline = std::chrono::steady_clock::now() + kGraceWindow;
    std::optional<ExitStatus> exited;
    while (true) {
        auto r = child.try_wait();
        if (!r) {
            (void)child.send_signal(SIGKILL);
            if (auto w = child.wait(); !w) {
                std::println(stderr, "supervisor: could not reap {}: {}", desc.display_name, w.error());
            }
            return std::unexpected(StartError{
                StartErrorKind::SpawnFailed,
                std::format("Failed to check {} process status: {}", desc.display_name, r.error()),
            });
        }
        if (r->has_value()) {
            exited = **r;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(kPollStep);
    }

    if (exited) {
        auto diagnostic = first_lines(child.captured_stderr(), kDiagnosticLines);
        if (diagnostic.empty()) diagnostic = exited->describe();
        log(std::format("{} exited during startup: {}", desc.display_name, diagnostic));
        return std::unexpected(StartError{StartErrorKind::SpawnFailed, diagnostic});
    }

    // The child keeps its stderr file; we no longer need to read it.
    child.release_stderr();
    log(std::format("{} running, PID {}", desc.display_name, child.pid()));
    records_.emplace(id, OwnedProcess{std::move(child), std::chrono::system_clock::now()});
    return {};
}

std::expected<void, StopError> ProcessSupervisor::stop_locked(ToolId id) {
    auto it = records_.find(id);
    if (it == records_.end()) return {};

    const auto& desc = describe(id);
    log(std::format("Stopping {}...", desc.display_name));

    if (auto* owned = std::get_if<OwnedProcess>(&it->second)) {
        // The child is unreachable after a failed forced stop, so the record
        // goes either way.
        auto res = stop_owned(id, *owned);
        records_.erase(it);
        return res;
    }

    // Never had a cooperative handle: no graceful phase.
    auto pid = std::get<ExternalProcess>(it->second).pid;
    records_.erase(it);

    if (auto res = table_.terminate(pid); !res) {
        return std::unexpected(StopError{
            std::format("Failed to stop {} (external, PID {}): {}", desc.display_name, pid, res.error()),
        });
    }
    log(std::format("{} (external, PID {}) stopped", desc.display_name, pid));
    return {};
}

std::expected<void, StopError> ProcessSupervisor::stop_owned(ToolId id, OwnedProcess& owned) {
    const auto& desc = describe(id);
    auto& child = owned.child;

    if (auto res = child.send_signal(SIGTERM); !res) {
        log(std::format("{}: SIGTERM failed: {}", desc.display_name, res.error()));
    }

    auto deadline = std::chrono::steady_clock::now() + kStopTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto r = child.try_wait();
        if (!r) break;
        if (r->has_value()) {
            log(std::format("{} stopped gracefully", desc.display_name));
            return {};
        }
        std::this_thread::sleep_for(kPollStep);
    }

    // Graceful window expired: force it.
    if (auto res = child.send_signal(SIGKILL); !res) {
        return std::unexpected(StopError{
            std::format("Failed to kill {}: {}", desc.display_name, res.error()),
        });
    }
    if (auto res = child.wait(); !res) {
        return std::unexpected(StopError{
            std::format("Failed to reap {}: {}", desc.display_name, res.error()),
        });
    }

    log(std::format("{} force killed", desc.display_name));
    return {};
}

void ProcessSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolhub] {}", msg);
    }
}
