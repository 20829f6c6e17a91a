#include "tree_extractor.hpp"

using json = nlohmann::json;

TreeExtractor::TreeExtractor(size_t max_depth)
    : max_depth_(max_depth) {}

std::vector<WindowRecord> TreeExtractor::extract(const json& root) {
    skipped_ = 0;
    truncated_ = 0;
    last_skip_reason_.clear();

    std::vector<WindowRecord> windows;
    walk(root, 0, windows);
    return windows;
}

bool TreeExtractor::is_window_type(const std::string& type) {
    return type == "con" || type == "floating_con";
}

void TreeExtractor::walk(const json& node, size_t depth, std::vector<WindowRecord>& out) {
    if (!node.is_object()) return;

    if (depth >= max_depth_) {
        ++truncated_;
        return;
    }

    auto type = node.find("type");
    if (type != node.end() && type->is_string() && is_window_type(type->get_ref<const std::string&>())) {
        auto rec = WindowRecord::decode(node);
        if (rec) {
            out.push_back(std::move(*rec));
        } else {
            ++skipped_;
            last_skip_reason_ = rec.error();
        }
    }

    walk_children(node, "nodes", depth, out);
    walk_children(node, "floating_nodes", depth, out);
}

void TreeExtractor::walk_children(const json& node, const char* key, size_t depth,
                                  std::vector<WindowRecord>& out) {
    auto children = node.find(key);
    if (children == node.end() || !children->is_array()) return;

    for (const auto& child : *children) {
        walk(child, depth + 1, out);
    }
}
