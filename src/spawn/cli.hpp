#pragma once

#include "platform/window_manager.hpp"

#include <cstdio>

// Parses argv, loads the config and performs one toggle through `wm`.
// Returns the process exit code. A fatal error writes exactly one "spawn: ..." line to `err`.
int run(int argc, char* argv[], WindowManager& wm, std::FILE* out = stdout, std::FILE* err = stderr);
