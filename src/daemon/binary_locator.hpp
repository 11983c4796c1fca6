#pragma once

#include "tool_catalog.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

class BinaryLocator {
public:
    using ExistsFn = std::function<bool(const std::filesystem::path&)>;

    struct SearchRoots {
        std::filesystem::path exe_dir;  // directory of the running hub executable
        std::filesystem::path cwd;
        bool dev_search = false;        // also probe build-output directories
    };

    explicit BinaryLocator(SearchRoots roots, ExistsFn exists = is_regular_file);

    // Roots derived from /proc/self/exe and the current working directory.
    static SearchRoots detect_roots(bool dev_search);

    // First existing candidate wins; a hit is cached for the next lookup.
    std::optional<std::filesystem::path> locate(ToolId id);

    // Ordered probe list, excluding the cache.
    std::vector<std::filesystem::path> candidates(ToolId id) const;

    const SearchRoots& roots() const { return roots_; }

private:
    static bool is_regular_file(const std::filesystem::path& p);

    SearchRoots roots_;
    ExistsFn exists_;

    std::mutex cache_mutex_;
    std::map<ToolId, std::filesystem::path> cache_;
};
