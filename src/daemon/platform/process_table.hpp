#pragma once

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One enumeration of the OS process table: lowercased executable name -> every
// PID running under that name, ascending.
class ProcessSnapshot {
public:
    void add(std::string name, int pid);

    // Lowest PID running under `name`.
    std::optional<int> find(const std::string& name) const;
    bool contains(const std::string& name, int pid) const;
    const std::vector<int>& pids(const std::string& name) const;

    size_t size() const { return by_name_.size(); }
    bool empty() const { return by_name_.empty(); }

private:
    std::map<std::string, std::vector<int>> by_name_;
};

class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    // Expensive: walks every process on the system.
    virtual ProcessSnapshot snapshot() const = 0;

    // Cheap liveness probe for a PID we do not own.
    virtual bool is_running(int pid) const = 0;

    // Forceful termination of a PID we do not own. A PID that is already gone
    // is success.
    virtual std::expected<void, std::string> terminate(int pid) = 0;
};
