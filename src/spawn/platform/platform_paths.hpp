#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/spawn or ~/.config/spawn. Empty if neither variable is set.
std::string config_dir();

// Window manager IPC socket: $SWAYSOCK, then $I3SOCK. Empty if neither is set.
std::string wm_socket_path();

} // namespace platform
