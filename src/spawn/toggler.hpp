#pragma once

#include "config.hpp"
#include "platform/window_manager.hpp"
#include "toggle.hpp"

#include <cstdio>
#include <expected>
#include <string>

// One toggle per call: look up the app, connect, snapshot the tree, find the app's
// windows, dispatch one action. The app is looked up before any window manager I/O.
class Toggler {
public:
    Toggler(const Config& config, WindowManager& wm, bool verbose = false, std::FILE* log_out = stderr);

    // Returns the action that was dispatched. Nothing is dispatched on error.
    std::expected<Action, std::string> toggle(const std::string& app_name);

private:
    void log(const std::string& msg);

    const Config& config_;
    WindowManager& wm_;
    bool verbose_;
    std::FILE* log_out_;
};
