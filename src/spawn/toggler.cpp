#include "toggler.hpp"

#include "sway/tree_extractor.hpp"

#include <format>
#include <print>

Toggler::Toggler(const Config& config, WindowManager& wm, bool verbose, std::FILE* log_out)
    : config_(config), wm_(wm), verbose_(verbose), log_out_(log_out) {}

void Toggler::log(const std::string& msg) {
    if (verbose_) std::println(log_out_, "[spawn] {}", msg);
}

std::expected<Action, std::string> Toggler::toggle(const std::string& app_name) {
    const AppConfig* app = config_.find(app_name);
    if (!app) return std::unexpected(std::format("unknown application: {}", app_name));

    auto conn = wm_.connect();
    if (!conn) return std::unexpected(conn.error());

    auto tree = wm_.get_tree();
    if (!tree) return std::unexpected(tree.error());

    TreeExtractor extractor;
    auto windows = extractor.extract(*tree);
    log(std::format("{} windows in tree", windows.size()));
    if (extractor.skipped() > 0)
        log(std::format("skipped {} malformed window nodes (last: {})", extractor.skipped(),
                        extractor.last_skip_reason()));
    if (extractor.truncated() > 0)
        log(std::format("tree deeper than {} levels, {} subtrees not visited",
                        extractor.max_depth(), extractor.truncated()));

    auto state = resolve_state(windows, app->identifier);
    log(std::format("{} is {}", app_name, to_string(state)));

    auto action = decide(state, *app, config_.terminal);
    if (!action) return std::unexpected(std::format("{}: {}", app_name, action.error()));

    auto command = action->command();
    log(std::format("{}: {}", to_string(action->kind), command));

    auto res = wm_.run_command(command);
    if (!res) return std::unexpected(res.error());

    return action;
}
