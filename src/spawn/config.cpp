#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::expected<AppConfig, std::string> parse_app(const json& a) {
    if (!a.is_object()) return std::unexpected("entry must be an object");

    AppConfig app;

    if (!a.contains("command") || !a["command"].is_string())
        return std::unexpected("\"command\" must be a string");
    app.command = a["command"].get<std::string>();

    if (a.contains("is_terminal")) {
        if (!a["is_terminal"].is_boolean()) return std::unexpected("\"is_terminal\" must be a boolean");
        app.is_terminal = a["is_terminal"].get<bool>();
    }

    if (!a.contains("identifier")) return std::unexpected("\"identifier\" is required");
    auto id = Identifier::from_json(a["identifier"]);
    if (!id) return std::unexpected(id.error());
    app.identifier = std::move(*id);

    if (a.contains("startup_override") && !a["startup_override"].is_null()) {
        if (!a["startup_override"].is_string())
            return std::unexpected("\"startup_override\" must be a string");
        app.startup_override = a["startup_override"].get<std::string>();
    }

    return app;
}

} // namespace

const AppConfig* Config::find(const std::string& app_name) const {
    auto it = apps.find(app_name);
    return it == apps.end() ? nullptr : &it->second;
}

std::expected<Config, std::string> Config::parse(const std::string& text) {
    Config cfg;

    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("top level must be an object");

        if (j.contains("terminal")) {
            if (!j["terminal"].is_string()) return std::unexpected("\"terminal\" must be a string");
            cfg.terminal = j["terminal"].get<std::string>();
        }

        if (j.contains("apps")) {
            auto& apps = j["apps"];
            if (!apps.is_object()) return std::unexpected("\"apps\" must be an object");
            for (auto& [name, entry] : apps.items()) {
                auto app = parse_app(entry);
                if (!app) return std::unexpected(std::format("app \"{}\": {}", name, app.error()));
                cfg.apps.emplace(name, std::move(*app));
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("parse error: {}", e.what()));
    }

    return cfg;
}

std::expected<Config, std::string> Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::unexpected(std::format("could not open {}", path));

    std::stringstream ss;
    ss << f.rdbuf();

    auto cfg = parse(ss.str());
    if (!cfg) return std::unexpected(std::format("{}: {}", path, cfg.error()));
    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "spawn.json").string();
}

std::expected<Config, std::string> Config::load_default() {
    auto path = default_path();
    if (path.empty() || !fs::is_regular_file(path)) return Config{};
    return load(path);
}
