#pragma once

#include "window_record.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Flattens a sway GET_TREE snapshot into the list of window-bearing nodes.
//
// Only nodes of type "con" or "floating_con" produce a record; every node is descended
// through both "nodes" and "floating_nodes". A window-bearing node that fails to decode
// is skipped and counted, its children are still visited.
class TreeExtractor {
public:
    static constexpr size_t DEFAULT_MAX_DEPTH = 512;

    explicit TreeExtractor(size_t max_depth = DEFAULT_MAX_DEPTH);

    // Pre-order: a node's own record precedes its "nodes" subtree, which precedes
    // its "floating_nodes" subtree. Counters are reset on every call.
    std::vector<WindowRecord> extract(const nlohmann::json& root);

    size_t max_depth() const { return max_depth_; }
    size_t skipped() const { return skipped_; }
    size_t truncated() const { return truncated_; }
    // Decode error of the most recently skipped node, for diagnostics.
    const std::string& last_skip_reason() const { return last_skip_reason_; }

    static bool is_window_type(const std::string& type);

private:
    void walk(const nlohmann::json& node, size_t depth, std::vector<WindowRecord>& out);
    void walk_children(const nlohmann::json& node, const char* key, size_t depth,
                       std::vector<WindowRecord>& out);

    size_t max_depth_;
    size_t skipped_ = 0;
    size_t truncated_ = 0; // subtrees cut off by the depth bound
    std::string last_skip_reason_;
};
