#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual std::expected<void, std::string> connect() = 0;
    // Full layout tree snapshot.
    virtual std::expected<nlohmann::json, std::string> get_tree() = 0;
    // Runs one command; fails if the window manager reports it unsuccessful.
    virtual std::expected<void, std::string> run_command(const std::string& command) = 0;
};
