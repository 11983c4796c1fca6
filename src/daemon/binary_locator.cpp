#include "binary_locator.hpp"

#include <system_error>

namespace fs = std::filesystem;

BinaryLocator::BinaryLocator(SearchRoots roots, ExistsFn exists)
    : roots_(std::move(roots)), exists_(std::move(exists)) {}

BinaryLocator::SearchRoots BinaryLocator::detect_roots(bool dev_search) {
    SearchRoots roots;
    roots.dev_search = dev_search;

    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) roots.exe_dir = exe.parent_path();

    auto cwd = fs::current_path(ec);
    if (!ec) roots.cwd = cwd;

    return roots;
}

std::optional<fs::path> BinaryLocator::locate(ToolId id) {
    std::lock_guard lock(cache_mutex_);

    if (auto it = cache_.find(id); it != cache_.end()) {
        if (exists_(it->second)) return it->second;
        cache_.erase(it);
    }

    for (auto& path : candidates(id)) {
        if (exists_(path)) {
            cache_[id] = path;
            return path;
        }
    }
    return std::nullopt;
}

std::vector<fs::path> BinaryLocator::candidates(ToolId id) const {
    std::vector<fs::path> out;
    auto name = executable_name(id);

    if (!roots_.exe_dir.empty()) {
        out.push_back(roots_.exe_dir / name);
        out.push_back(roots_.exe_dir / "tools" / name);
        out.push_back(roots_.exe_dir / "resources" / "tools" / name);
    }

    if (roots_.dev_search && !roots_.cwd.empty()) {
        auto slug = describe(id).slug;
        for (auto& dir : {roots_.cwd, roots_.cwd / "..", roots_.cwd / ".." / ".."}) {
            out.push_back((dir / "build" / name).lexically_normal());
            out.push_back((dir / "build" / "tools" / slug / name).lexically_normal());
            out.push_back((dir / "tools" / slug / "build" / name).lexically_normal());
        }
    }

    return out;
}

bool BinaryLocator::is_regular_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}
