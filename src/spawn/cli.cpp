#include "cli.hpp"

#include "config.hpp"
#include "toggler.hpp"

#include <filesystem>
#include <print>
#include <string>

#ifndef SPAWN_VERSION
#define SPAWN_VERSION "unknown"
#endif

static void usage(std::FILE* f, const char* prog) {
    std::println(f, "Usage: {} [options] <app>", prog);
    std::println(f, "Launch <app>, focus it, or move it to the scratchpad.");
    std::println(f, "Options:");
    std::println(f, "  -c, --config PATH   Config file path (default: {})", Config::default_path());
    std::println(f, "  -v, --verbose       Trace each step to stderr");
    std::println(f, "  -V, --version       Show version");
    std::println(f, "  -h, --help          Show this help");
}

int run(int argc, char* argv[], WindowManager& wm, std::FILE* out, std::FILE* err) {
    const char* prog = argc > 0 ? argv[0] : "spawn";
    bool verbose = false;
    std::string config_path;
    std::string app_name;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(err, "spawn: {} needs a path", arg);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(out, prog);
            return 0;
        } else if (arg == "--version" || arg == "-V") {
            std::println(out, "spawn {}", SPAWN_VERSION);
            return 0;
        } else if (arg.starts_with("-") || !app_name.empty()) {
            std::println(err, "spawn: unexpected argument '{}'", arg);
            usage(err, prog);
            return 1;
        } else {
            app_name = arg;
        }
    }

    if (app_name.empty()) {
        usage(err, prog);
        return 1;
    }

    if (config_path.empty()) {
        auto path = Config::default_path();
        if (verbose) {
            if (std::filesystem::is_regular_file(path))
                std::println(err, "[spawn] config: {}", path);
            else
                std::println(err, "[spawn] no config at '{}', no apps configured", path);
        }
    } else if (verbose) {
        std::println(err, "[spawn] config: {}", config_path);
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!config) {
        std::println(err, "spawn: config: {}", config.error());
        return 1;
    }

    Toggler toggler(*config, wm, verbose, err);
    if (auto res = toggler.toggle(app_name); !res) {
        std::println(err, "spawn: {}", res.error());
        return 1;
    }

    return 0;
}
