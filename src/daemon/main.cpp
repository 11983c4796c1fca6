#include "binary_locator.hpp"
#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <filesystem>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    bool dev = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--dev") {
            dev = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "--config requires a path");
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: toolhubd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("      --dev           Also look for tools in build directories");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 2;
        }
    }

    HubConfig config;
    if (!config_path.empty()) {
        // The daemon changes directory to / once detached.
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_path, ec);
        if (!ec) config_path = abs.string();
        config = HubConfig::load(config_path);
    } else {
        config_path = HubConfig::default_path();
        config = HubConfig::load_default();
    }

    // Resolved before daemonizing, while the launch directory is still current.
    auto roots = BinaryLocator::detect_roots(dev || config.dev_search);

    if (!foreground) {
        platform::daemonize();
    }

    if (verbose && foreground) {
        std::println(stderr, "[toolhub] Starting (config: {})",
                     config_path.empty() ? "<defaults>" : config_path);
    }

    LinuxEventLoop loop(std::move(config), std::move(config_path), std::move(roots), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
