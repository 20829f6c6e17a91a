#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/spawn";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/spawn";
}

std::string wm_socket_path() {
    for (const char* var : {"SWAYSOCK", "I3SOCK"}) {
        const char* sock = std::getenv(var);
        if (sock && *sock) return sock;
    }
    return {};
}

} // namespace platform
