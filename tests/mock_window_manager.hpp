#pragma once

#include "platform/window_manager.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Records every call; each step fails when its *_error is set.
class MockWindowManager : public WindowManager {
public:
    std::expected<void, std::string> connect() override {
        ++connects;
        if (!connect_error.empty()) return std::unexpected(connect_error);
        return {};
    }

    std::expected<nlohmann::json, std::string> get_tree() override {
        ++tree_requests;
        if (!tree_error.empty()) return std::unexpected(tree_error);
        return tree;
    }

    std::expected<void, std::string> run_command(const std::string& command) override {
        commands.push_back(command);
        if (!command_error.empty()) return std::unexpected(command_error);
        return {};
    }

    nlohmann::json tree = nlohmann::json::object();
    std::string connect_error;
    std::string tree_error;
    std::string command_error;
    int connects = 0;
    int tree_requests = 0;
    std::vector<std::string> commands;
};
