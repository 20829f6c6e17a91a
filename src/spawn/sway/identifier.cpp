#include "identifier.hpp"

#include <array>
#include <format>
#include <utility>

using json = nlohmann::json;

namespace {

struct TagSpelling {
    const char* key;
    Identifier::Kind kind;
};

constexpr std::array<TagSpelling, 6> TAGS = {{
    {"title", Identifier::Kind::Title},
    {"app_id", Identifier::Kind::AppId},
    {"class", Identifier::Kind::Class},
    {"Title", Identifier::Kind::Title},
    {"AppId", Identifier::Kind::AppId},
    {"Class", Identifier::Kind::Class},
}};

} // namespace

std::expected<Identifier, std::string> Identifier::from_json(const json& j) {
    if (!j.is_object())
        return std::unexpected("identifier must be an object like {\"app_id\": \"...\"}");
    if (j.size() != 1)
        return std::unexpected(std::format("identifier must have exactly one key, got {}", j.size()));

    auto it = j.begin();
    for (const auto& tag : TAGS) {
        if (it.key() != tag.key) continue;
        if (!it.value().is_string())
            return std::unexpected(std::format("identifier \"{}\" must be a string", it.key()));
        return Identifier{tag.kind, it.value().get<std::string>()};
    }
    return std::unexpected(std::format("unknown identifier kind \"{}\" (expected title, app_id or class)",
                                       it.key()));
}

std::string_view criteria_key(Identifier::Kind kind) {
    switch (kind) {
    case Identifier::Kind::Title: return "title";
    case Identifier::Kind::AppId: return "app_id";
    case Identifier::Kind::Class: return "class";
    }
    std::unreachable();
}

std::string regex_literal(std::string_view literal) {
    std::string out;
    out.reserve(literal.size());
    for (char c : literal) {
        if (std::string_view("\\^$.|?*+()[]{}").find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string render_criteria(const Identifier& id) {
    // Sway matches criteria values as PCRE. Anchor and fold case so it selects exactly
    // the windows matches() accepts.
    std::string pattern = "(?i)^" + regex_literal(id.value) + "$";

    // Sway's quoted-string parser only unescapes \"
    std::string quoted;
    quoted.reserve(pattern.size());
    for (char c : pattern) {
        if (c == '"') quoted.push_back('\\');
        quoted.push_back(c);
    }
    return std::format("[{}=\"{}\"]", criteria_key(id.kind), quoted);
}
