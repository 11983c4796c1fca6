#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

std::string_view client_error_message(ClientError err) {
    switch (err) {
        case ClientError::NotRunning: return "hub is not running";
        case ClientError::SendFailed: return "failed to send command";
        case ClientError::Timeout: return "no response from hub (timeout)";
        case ClientError::Closed: return "hub closed the connection";
        case ClientError::BadResponse: return "malformed response from hub";
    }
    return "unknown error";
}

UnixSocketClient::~UnixSocketClient() {
    close();
}

std::expected<void, ClientError> UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return std::unexpected(ClientError::NotRunning);
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return std::unexpected(ClientError::NotRunning);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close();
        return std::unexpected(ClientError::NotRunning);
    }
    return {};
}

std::expected<nlohmann::json, ClientError> UnixSocketClient::request(const nlohmann::json& cmd,
                                                                     int timeout_ms) {
    if (auto sent = send(cmd); !sent) return std::unexpected(sent.error());
    return receive(timeout_ms);
}

std::expected<void, ClientError> UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return std::unexpected(ClientError::SendFailed);

    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(ClientError::SendFailed);
        }
        off += static_cast<size_t>(sent);
    }
    return {};
}

std::expected<nlohmann::json, ClientError> UnixSocketClient::receive(int timeout_ms) {
    if (fd_ < 0) return std::unexpected(ClientError::Closed);

    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (pending_.find('\n') == std::string::npos) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return std::unexpected(ClientError::Timeout);

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(ClientError::Closed);
        }
        if (ret == 0) return std::unexpected(ClientError::Timeout);

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::unexpected(ClientError::Closed);
        pending_.append(tmp, static_cast<size_t>(n));
    }

    auto pos = pending_.find('\n');
    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);

    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(ClientError::BadResponse);
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
