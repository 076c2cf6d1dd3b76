#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppDir = "meeting-scribe";

// $<xdg_var>/meeting-scribe, else $HOME/<home_rel>/meeting-scribe.
std::string xdg_app_dir(const char* xdg_var, const char* home_rel) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/" + kAppDir;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_rel + "/" + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/meeting-scribe.sock";
    // /tmp is shared; keep one socket per user.
    return "/tmp/meeting-scribe-" + std::to_string(::getuid()) + ".sock";
}

std::string daemon_log_path() {
    auto dir = data_dir();
    return dir.empty() ? std::string() : dir + "/daemon.log";
}

} // namespace platform
