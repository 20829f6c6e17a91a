#pragma once

#include "config.hpp"
#include "sway/identifier.hpp"
#include "sway/window_record.hpp"

#include <expected>
#include <span>
#include <string>
#include <string_view>

enum class WindowState { Absent, Unfocused, Focused };

std::string_view to_string(WindowState state);

// Absent if no window matches, Focused if any matching window has focus, Unfocused otherwise.
// Focus on windows that do not match is ignored.
WindowState resolve_state(std::span<const WindowRecord> windows, const Identifier& id);

struct Action {
    enum class Kind { Launch, Focus, Hide };

    Kind kind;
    // Launch: the shell command to exec. Focus/Hide: a rendered criteria block.
    std::string argument;

    // The sway command for this action: "exec ...", "<criteria> focus" or
    // "<criteria> move scratchpad".
    std::string command() const;

    bool operator==(const Action&) const = default;
};

std::string_view to_string(Action::Kind kind);

// The command used to start an app that has no window yet. A startup_override wins
// verbatim. A terminal-hosted app with a title identifier is wrapped in the configured
// terminal, titled so its window can be found on the next toggle.
std::expected<std::string, std::string> build_startup_command(const AppConfig& app,
                                                              const std::string& terminal);

// Launch when absent, focus when unfocused, move to the scratchpad when focused.
std::expected<Action, std::string> decide(WindowState state, const AppConfig& app,
                                          const std::string& terminal);

// Single-quotes a word for sh when it contains anything outside a conservative safe set.
std::string shell_quote(const std::string& word);
