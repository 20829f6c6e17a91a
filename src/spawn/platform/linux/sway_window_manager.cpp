#include "platform/linux/sway_window_manager.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

using json = nlohmann::json;

SwayWindowManager::SwayWindowManager() = default;

SwayWindowManager::SwayWindowManager(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SwayWindowManager::~SwayWindowManager() {
    if (fd_ >= 0) ::close(fd_);
}

std::expected<void, std::string> SwayWindowManager::connect() {
    if (socket_path_.empty()) socket_path_ = platform::wm_socket_path();
    if (socket_path_.empty()) return std::unexpected("sway: neither $SWAYSOCK nor $I3SOCK is set");

    sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path))
        return std::unexpected(std::format("sway: socket path too long: {}", socket_path_));

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::unexpected(std::format("sway: socket() failed: {}", std::strerror(errno)));

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(std::format("sway: connect to {} failed: {}", socket_path_, std::strerror(err)));
    }

    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
    return {};
}

std::expected<json, std::string> SwayWindowManager::get_tree() {
    auto reply = request(MSG_GET_TREE);
    if (!reply) return std::unexpected(reply.error());

    try {
        return json::parse(*reply);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("sway: could not parse tree: {}", e.what()));
    }
}

std::expected<void, std::string> SwayWindowManager::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    json results;
    try {
        results = json::parse(*reply);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("sway: could not parse command reply: {}", e.what()));
    }

    if (!results.is_array() || results.empty())
        return std::unexpected(std::format("sway: unexpected command reply: {}", results.dump()));

    for (const auto& r : results) {
        if (r.is_object() && r.value("success", false)) continue;
        std::string error = r.is_object() ? r.value("error", "unknown error") : r.dump();
        return std::unexpected(std::format("sway: '{}' failed: {}", command, error));
    }
    return {};
}

std::expected<std::string, std::string> SwayWindowManager::request(uint32_t type,
                                                                   const std::string& payload) {
    if (fd_ < 0) return std::unexpected("sway: not connected");

    if (!send_message(type, payload))
        return std::unexpected(std::format("sway: send failed: {}", std::strerror(errno)));

    uint32_t reply_type = 0;
    std::string reply;
    if (!recv_message(reply_type, reply)) return std::unexpected("sway: no valid reply");

    if (reply_type != type)
        return std::unexpected(std::format("sway: reply type {} does not match request type {}",
                                           reply_type, type));
    return reply;
}

bool SwayWindowManager::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes), native byte order
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[HEADER_SIZE];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, HEADER_SIZE, MSG_NOSIGNAL) != static_cast<ssize_t>(HEADER_SIZE)) return false;
    if (len > 0) {
        if (::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayWindowManager::recv_message(uint32_t& type, std::string& payload) {
    char header[HEADER_SIZE];
    size_t read_total = 0;
    while (read_total < HEADER_SIZE) {
        ssize_t n = ::recv(fd_, header + read_total, HEADER_SIZE - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
