#include "platform/process_table.hpp"

#include <algorithm>

void ProcessSnapshot::add(std::string name, int pid) {
    auto& list = by_name_[std::move(name)];
    auto it = std::ranges::lower_bound(list, pid);
    if (it == list.end() || *it != pid) list.insert(it, pid);
}

std::optional<int> ProcessSnapshot::find(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool ProcessSnapshot::contains(const std::string& name, int pid) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return false;
    return std::ranges::binary_search(it->second, pid);
}

const std::vector<int>& ProcessSnapshot::pids(const std::string& name) const {
    static const std::vector<int> none;
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : none;
}
