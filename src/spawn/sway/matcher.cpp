#include "matcher.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace {

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool field_matches(const std::optional<std::string>& field, const std::string& wanted) {
    return field && iequals_ascii(*field, wanted);
}

} // namespace

bool iequals_ascii(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
}

bool matches(const WindowRecord& window, const Identifier& id) {
    switch (id.kind) {
    case Identifier::Kind::Title: return field_matches(window.title, id.value);
    case Identifier::Kind::AppId: return field_matches(window.app_id, id.value);
    case Identifier::Kind::Class: return field_matches(window.window_class(), id.value);
    }
    std::unreachable();
}
