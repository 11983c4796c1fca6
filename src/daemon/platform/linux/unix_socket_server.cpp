#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

bool fill_address(const std::string& path, sockaddr_un& addr) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

} // namespace

UnixSocketServer::~UnixSocketServer() {
    shutdown();
}

bool UnixSocketServer::endpoint_in_use(const std::string& path) {
    sockaddr_un addr;
    if (!fill_address(path, addr)) return false;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool live = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return live;
}

bool UnixSocketServer::listen(const std::string& endpoint) {
    sockaddr_un addr;
    if (!fill_address(endpoint, addr)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }

    if (endpoint_in_use(endpoint)) {
        std::println(stderr, "ipc: another hub is already listening on {}", endpoint);
        return false;
    }
    // Nobody answers, so whatever is left at the path is stale.
    ::unlink(endpoint.c_str());

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    auto fail = [this](const char* what) {
        std::println(stderr, "ipc: {} failed: {}", what, std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    };

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) return fail("bind()");
    socket_path_ = endpoint;

    // The socket can start and stop processes: owner only.
    if (::chmod(endpoint.c_str(), 0600) < 0) return fail("chmod()");
    if (::listen(listen_fd_, 8) < 0) return fail("listen()");

    return true;
}

void UnixSocketServer::shutdown() {
    for (auto& c : clients_) ::close(c.fd);
    clients_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept4() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    if (clients_.size() >= kMaxClients) {
        std::println(stderr, "ipc: refusing client, {} already connected", clients_.size());
        ::close(fd);
        return -1;
    }
    clients_.push_back({fd, {}});
    return fd;
}

ReadResult UnixSocketServer::next_command(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) return {ReadStatus::Disconnected, {}};

    if (client->pending.find('\n') != std::string::npos) return take_line(*client);

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return {};
        return {ReadStatus::Disconnected, {}};
    }
    if (n == 0) return {ReadStatus::Disconnected, {}};

    client->pending.append(buf, static_cast<size_t>(n));
    if (client->pending.find('\n') == std::string::npos) {
        if (client->pending.size() > kMaxLine) return {ReadStatus::Disconnected, {}};
        return {};
    }
    return take_line(*client);
}

bool UnixSocketServer::reply(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            // Responses are small; a full send buffer means the client is not reading.
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::drop_client(int client_fd) {
    if (std::erase_if(clients_, [client_fd](const Client& c) { return c.fd == client_fd; }) > 0) {
        ::close(client_fd);
    }
}

UnixSocketServer::Client* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

ReadResult UnixSocketServer::take_line(Client& client) {
    auto pos = client.pending.find('\n');
    std::string line = client.pending.substr(0, pos);
    client.pending.erase(0, pos + 1);

    ReadResult result{ReadStatus::Malformed, {}};
    try {
        result.command = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return result;
    }
    if (result.command.is_object()) result.status = ReadStatus::Command;
    return result;
}
