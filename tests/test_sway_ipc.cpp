#include <catch2/catch_test_macros.hpp>

#include "platform/linux/sway_window_manager.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/spawn_test_sway_" + std::to_string(getpid()) + ".sock";
}

// Accepts one client and answers each request with the next canned reply.
class FakeSway {
public:
    explicit FakeSway(const std::string& path) : path_(path) {
        std::filesystem::remove(path_);
        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(listen_fd_ >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(listen_fd_, 1) == 0);
    }

    ~FakeSway() {
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
        std::filesystem::remove(path_);
    }

    // Serve `count` requests. A reply type of UINT32_MAX echoes the request type.
    void serve(std::vector<std::pair<uint32_t, std::string>> replies, std::string magic = "i3-ipc") {
        thread_ = std::thread([this, replies = std::move(replies), magic] {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;
            for (const auto& [reply_type, body] : replies) {
                uint32_t type = 0;
                std::string payload;
                if (!read_request(fd, type, payload)) break;
                requests.emplace_back(type, payload);
                write_reply(fd, magic, reply_type == UINT32_MAX ? type : reply_type, body);
            }
            ::close(fd);
        });
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    std::vector<std::pair<uint32_t, std::string>> requests;

private:
    static bool read_all(int fd, char* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    static bool read_request(int fd, uint32_t& type, std::string& payload) {
        char header[14];
        if (!read_all(fd, header, sizeof(header))) return false;
        uint32_t len;
        std::memcpy(&len, header + 6, 4);
        std::memcpy(&type, header + 10, 4);
        payload.resize(len);
        return len == 0 || read_all(fd, payload.data(), len);
    }

    static void write_reply(int fd, const std::string& magic, uint32_t type, const std::string& body) {
        uint32_t len = static_cast<uint32_t>(body.size());
        char header[14];
        std::memcpy(header, magic.data(), 6);
        std::memcpy(header + 6, &len, 4);
        std::memcpy(header + 10, &type, 4);
        ::send(fd, header, sizeof(header), MSG_NOSIGNAL);
        ::send(fd, body.data(), body.size(), MSG_NOSIGNAL);
    }

    std::string path_;
    int listen_fd_ = -1;
    std::thread thread_;
};

constexpr uint32_t ECHO = UINT32_MAX;

} // namespace

TEST_CASE("SwayWindowManager", "[sway]") {
    auto sock_path = tmp_socket_path();

    SECTION("NotConnected") {
        SwayWindowManager wm(sock_path);
        REQUIRE_FALSE(wm.get_tree());
        REQUIRE_FALSE(wm.run_command("nop"));
    }

    SECTION("ConnectFailsWithoutServer") {
        std::filesystem::remove(sock_path);
        SwayWindowManager wm(sock_path);
        auto res = wm.connect();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find(sock_path) != std::string::npos);
    }

    SECTION("GetTree") {
        FakeSway server(sock_path);
        server.serve({{ECHO, R"({"type":"root","nodes":[{"type":"con","name":"x","focused":true}]})"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        auto tree = wm.get_tree();
        REQUIRE(tree);
        REQUIRE((*tree)["type"] == "root");
        REQUIRE((*tree)["nodes"].size() == 1);

        server.join();
        REQUIRE(server.requests.size() == 1);
        REQUIRE(server.requests[0].first == SwayWindowManager::MSG_GET_TREE);
        REQUIRE(server.requests[0].second.empty());
    }

    SECTION("RunCommandSendsPayload") {
        FakeSway server(sock_path);
        server.serve({{ECHO, R"([{"success":true}])"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        REQUIRE(wm.run_command(R"([app_id="obsidian"] focus)"));

        server.join();
        REQUIRE(server.requests.size() == 1);
        REQUIRE(server.requests[0].first == SwayWindowManager::MSG_RUN_COMMAND);
        REQUIRE(server.requests[0].second == R"([app_id="obsidian"] focus)");
    }

    SECTION("RunCommandFailureReported") {
        FakeSway server(sock_path);
        server.serve({{ECHO, R"([{"success":false,"error":"No matching node."}])"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        auto res = wm.run_command(R"([title="x"] focus)");
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("No matching node.") != std::string::npos);
    }

    SECTION("RunCommandUnexpectedReply") {
        FakeSway server(sock_path);
        server.serve({{ECHO, R"({"success":true})"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        REQUIRE_FALSE(wm.run_command("nop"));
    }

    SECTION("UnparsableTree") {
        FakeSway server(sock_path);
        server.serve({{ECHO, "{not json"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        auto tree = wm.get_tree();
        REQUIRE_FALSE(tree);
        REQUIRE(tree.error().find("parse") != std::string::npos);
    }

    SECTION("ReplyTypeMismatch") {
        FakeSway server(sock_path);
        server.serve({{SwayWindowManager::MSG_RUN_COMMAND, "{}"}});

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        REQUIRE_FALSE(wm.get_tree());
    }

    SECTION("BadMagic") {
        FakeSway server(sock_path);
        server.serve({{ECHO, "{}"}}, "x3-ipc");

        SwayWindowManager wm(sock_path);
        REQUIRE(wm.connect());
        REQUIRE_FALSE(wm.get_tree());
    }
}
