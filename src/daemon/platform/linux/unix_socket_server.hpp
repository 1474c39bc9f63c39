#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Binds a 0600 socket at `endpoint`, replacing a stale one.
    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    const std::string& socket_path() const { return socket_path_; }

private:
    // Commands are a few dozen bytes; anything this long without a newline is garbage.
    static constexpr size_t max_line_bytes = 64 * 1024;

    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        std::string buf;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
