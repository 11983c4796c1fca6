#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppDir = "/toolhub";

// XDG base directory lookup; unset or empty variables fall back to $HOME.
std::string xdg_dir(const char* var, const char* home_relative) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + kAppDir;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_relative + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    if (const char* sock = std::getenv("TOOLHUB_SOCKET"); sock && *sock) return sock;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/toolhub.sock";
    return "/tmp/toolhub.sock";
}

} // namespace platform
