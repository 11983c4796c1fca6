#include "platform/linux/procfs_process_table.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <signal.h>

namespace fs = std::filesystem;

namespace {

// comm is truncated to TASK_COMM_LEN - 1 characters by the kernel.
constexpr size_t kCommMax = 15;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

ProcessSnapshot ProcfsProcessTable::snapshot() const {
    ProcessSnapshot snap;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto fname = entry.path().filename().string();
        int pid = 0;
        auto [ptr, perr] = std::from_chars(fname.data(), fname.data() + fname.size(), pid);
        if (perr != std::errc() || ptr != fname.data() + fname.size() || pid <= 0) continue;

        auto name = process_name(pid);
        if (name.empty()) continue;
        snap.add(std::move(name), pid);
    }

    return snap;
}

bool ProcfsProcessTable::is_running(int pid) const {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

std::expected<void, std::string> ProcfsProcessTable::terminate(int pid) {
    if (pid <= 0) return std::unexpected(std::format("invalid pid {}", pid));
    if (::kill(pid, SIGKILL) == 0 || errno == ESRCH) return {};
    return std::unexpected(std::format("kill({}) failed: {}", pid, std::strerror(errno)));
}

std::string ProcfsProcessTable::process_name(int pid) const {
    auto comm = read_comm(pid);
    if (comm.size() >= kCommMax) {
        // Interpreted scripts carry the interpreter in argv[0]; only trust it
        // when it extends the truncated comm.
        auto argv0 = read_argv0(pid);
        if (argv0.size() > comm.size() && argv0.starts_with(comm)) return to_lower(argv0);
    }
    return to_lower(comm);
}

std::string ProcfsProcessTable::read_comm(int pid) const {
    std::ifstream f(std::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsProcessTable::read_argv0(int pid) const {
    std::ifstream f(std::format("{}/{}/cmdline", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string argv0;
    std::getline(f, argv0, '\0');
    if (argv0.empty()) return {};
    return fs::path(argv0).filename().string();
}
