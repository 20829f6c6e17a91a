#pragma once

#include "identifier.hpp"
#include "window_record.hpp"

#include <string_view>

// ASCII-only case-insensitive equality. No locale folding, no substring matching.
bool iequals_ascii(std::string_view a, std::string_view b);

// True if the window carries the field named by the identifier's kind and it equals
// the identifier's value case-insensitively. A missing field never matches.
bool matches(const WindowRecord& window, const Identifier& id);
