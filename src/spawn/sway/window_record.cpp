#include "window_record.hpp"

using json = nlohmann::json;

namespace {

// Accepts a missing key or null as "absent", a string as present, anything else as malformed.
bool read_optional_string(const json& obj, const char* key, std::optional<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

std::expected<WindowRecord, std::string> WindowRecord::decode(const json& node) {
    if (!node.is_object()) return std::unexpected("node is not an object");

    WindowRecord rec;

    auto type = node.find("type");
    if (type == node.end() || !type->is_string())
        return std::unexpected("missing or non-string \"type\"");
    rec.node_type = type->get<std::string>();

    auto focused = node.find("focused");
    if (focused == node.end() || !focused->is_boolean())
        return std::unexpected("missing or non-boolean \"focused\"");
    rec.focused = focused->get<bool>();

    if (!read_optional_string(node, "name", rec.title))
        return std::unexpected("non-string \"name\"");
    if (!read_optional_string(node, "app_id", rec.app_id))
        return std::unexpected("non-string \"app_id\"");

    auto props = node.find("window_properties");
    if (props != node.end() && !props->is_null()) {
        if (!props->is_object())
            return std::unexpected("\"window_properties\" is not an object");
        WindowProperties wp;
        if (!read_optional_string(*props, "class", wp.window_class))
            return std::unexpected("non-string \"window_properties.class\"");
        rec.properties = std::move(wp);
    }

    return rec;
}
