#pragma once

#include "sway/identifier.hpp"

#include <expected>
#include <map>
#include <optional>
#include <string>

struct AppConfig {
    std::string command;
    bool is_terminal = false;                    // runs inside `Config::terminal`
    Identifier identifier;
    std::optional<std::string> startup_override; // used verbatim when set
};

struct Config {
    std::string terminal;
    std::map<std::string, AppConfig> apps;

    // nullptr if the app is not configured.
    const AppConfig* find(const std::string& app_name) const;

    static std::expected<Config, std::string> parse(const std::string& text);
    static std::expected<Config, std::string> load(const std::string& path);
    // Loads config_dir()/spawn.json. A missing file yields an empty config, silently.
    static std::expected<Config, std::string> load_default();
    static std::string default_path();
};
