#pragma once

#include "platform/command_server.hpp"

#include <string>
#include <vector>

// Newline-delimited JSON over a non-blocking AF_UNIX stream socket.
class UnixSocketServer : public CommandServer {
public:
    UnixSocketServer() = default;
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool listen(const std::string& endpoint) override;
    void shutdown() override;
    int listen_fd() const override { return listen_fd_; }
    int accept_client() override;
    ReadResult next_command(int client_fd) override;
    bool reply(int client_fd, const nlohmann::json& response) override;
    void drop_client(int client_fd) override;
    size_t client_count() const override { return clients_.size(); }

    // Upper bound for one buffered request line.
    static constexpr size_t kMaxLine = 64 * 1024;
    static constexpr size_t kMaxClients = 16;

private:
    struct Client {
        int fd;
        std::string pending;
    };

    Client* find_client(int fd);
    static ReadResult take_line(Client& client);

    // True if something accepts connections on `path`.
    static bool endpoint_in_use(const std::string& path);

    int listen_fd_ = -1;
    std::string socket_path_;
    std::vector<Client> clients_;
};
