#pragma once

#include "platform/window_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// i3-ipc client for sway (and i3). One synchronous request/reply per call.
class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager();
    explicit SwayWindowManager(std::string socket_path);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    // Uses the socket path given at construction, or $SWAYSOCK / $I3SOCK.
    std::expected<void, std::string> connect() override;
    std::expected<nlohmann::json, std::string> get_tree() override;
    std::expected<void, std::string> run_command(const std::string& command) override;

    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t HEADER_SIZE = 14;
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

private:
    std::expected<std::string, std::string> request(uint32_t type, const std::string& payload = "");
    bool send_message(uint32_t type, const std::string& payload);
    bool recv_message(uint32_t& type, std::string& payload);

    int fd_ = -1;
    std::string socket_path_;
};
