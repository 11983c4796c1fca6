#pragma once

#include "platform/process_table.hpp"

#include <string>

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    ProcessSnapshot snapshot() const override;
    bool is_running(int pid) const override;
    std::expected<void, std::string> terminate(int pid) override;

    // Executable name of a PID, lowercased; empty if it cannot be read.
    std::string process_name(int pid) const;

private:
    // Read /proc/{pid}/comm, return empty on failure.
    std::string read_comm(int pid) const;

    // Basename of argv[0] from /proc/{pid}/cmdline, return empty on failure.
    std::string read_argv0(int pid) const;

    std::string proc_root_;
};
