#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>

// How a configured application's windows are recognized. Every switch over Kind is
// exhaustive (no default branch); the build treats a missing case as an error.
struct Identifier {
    enum class Kind { Title, AppId, Class };

    Kind kind = Kind::AppId;
    std::string value;

    static Identifier by_title(std::string v) { return {Kind::Title, std::move(v)}; }
    static Identifier by_app_id(std::string v) { return {Kind::AppId, std::move(v)}; }
    static Identifier by_class(std::string v) { return {Kind::Class, std::move(v)}; }

    // Parses {"title": "..."} / {"app_id": "..."} / {"class": "..."}.
    // The tag spellings "Title", "AppId" and "Class" are accepted too.
    static std::expected<Identifier, std::string> from_json(const nlohmann::json& j);

    bool operator==(const Identifier&) const = default;
};

// Sway criteria attribute name for a kind: "title", "app_id" or "class".
std::string_view criteria_key(Identifier::Kind kind);

// Escapes PCRE metacharacters so the result matches `literal` verbatim.
std::string regex_literal(std::string_view literal);

// Renders a single-predicate criteria block matching the value exactly, ignoring case,
// e.g. [app_id="(?i)^obsidian$"]. Double quotes in the value are backslash escaped.
std::string render_criteria(const Identifier& id);
