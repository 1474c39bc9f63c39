#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/holdscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/holdscribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/holdscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/holdscribe";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/holdscribe.sock";
    return "/tmp/holdscribe.sock";
}

std::string temp_root() {
    // XDG_RUNTIME_DIR is a per-user 0700 tmpfs, so raw audio never reaches disk.
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return xdg;

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return tmp.string();
}

} // namespace platform
