#include "toggle.hpp"

#include "sway/matcher.hpp"

#include <algorithm>
#include <format>
#include <utility>

std::string_view to_string(WindowState state) {
    switch (state) {
    case WindowState::Absent: return "absent";
    case WindowState::Unfocused: return "unfocused";
    case WindowState::Focused: return "focused";
    }
    std::unreachable();
}

std::string_view to_string(Action::Kind kind) {
    switch (kind) {
    case Action::Kind::Launch: return "launch";
    case Action::Kind::Focus: return "focus";
    case Action::Kind::Hide: return "hide";
    }
    std::unreachable();
}

WindowState resolve_state(std::span<const WindowRecord> windows, const Identifier& id) {
    bool found = false;
    for (const auto& w : windows) {
        if (!matches(w, id)) continue;
        if (w.focused) return WindowState::Focused;
        found = true;
    }
    return found ? WindowState::Unfocused : WindowState::Absent;
}

std::string Action::command() const {
    switch (kind) {
    case Kind::Launch: return "exec " + argument;
    case Kind::Focus: return argument + " focus";
    case Kind::Hide: return argument + " move scratchpad";
    }
    std::unreachable();
}

std::string shell_quote(const std::string& word) {
    auto safe = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               std::string_view("_@%+=:,./-").find(c) != std::string_view::npos;
    };
    if (!word.empty() && std::ranges::all_of(word, safe)) return word;

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

std::expected<std::string, std::string> build_startup_command(const AppConfig& app,
                                                              const std::string& terminal) {
    if (app.startup_override) return *app.startup_override;

    if (app.is_terminal && app.identifier.kind == Identifier::Kind::Title) {
        if (terminal.empty())
            return std::unexpected("terminal-hosted app needs \"terminal\" set in the config");
        return std::format("{} --title {} --command {}", terminal, shell_quote(app.identifier.value),
                           app.command);
    }

    return app.command;
}

std::expected<Action, std::string> decide(WindowState state, const AppConfig& app,
                                          const std::string& terminal) {
    switch (state) {
    case WindowState::Absent: {
        auto cmd = build_startup_command(app, terminal);
        if (!cmd) return std::unexpected(cmd.error());
        return Action{Action::Kind::Launch, std::move(*cmd)};
    }
    case WindowState::Unfocused:
        return Action{Action::Kind::Focus, render_criteria(app.identifier)};
    case WindowState::Focused:
        return Action{Action::Kind::Hide, render_criteria(app.identifier)};
    }
    std::unreachable();
}
