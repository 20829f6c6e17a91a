#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct WindowProperties {
    std::optional<std::string> window_class; // X11 WM_CLASS, absent for native Wayland clients
};

// One window-bearing node of a sway tree snapshot.
struct WindowRecord {
    std::optional<std::string> title;          // "name"
    std::optional<std::string> app_id;         // Wayland app_id
    std::optional<WindowProperties> properties; // "window_properties" (XWayland only)
    bool focused = false;
    std::string node_type;                     // "con" or "floating_con"

    std::optional<std::string> window_class() const {
        if (!properties) return std::nullopt;
        return properties->window_class;
    }

    // Strict decode of a single tree node. Fails if a field is present with the wrong type
    // or "focused" is missing.
    static std::expected<WindowRecord, std::string> decode(const nlohmann::json& node);
};
