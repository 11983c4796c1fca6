#pragma once

#include "platform/hub_client.hpp"

#include <string>

class UnixSocketClient : public HubClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    std::expected<void, ClientError> connect(const std::string& endpoint) override;
    std::expected<nlohmann::json, ClientError> request(const nlohmann::json& cmd,
                                                       int timeout_ms = kDefaultTimeoutMs) override;
    void close() override;

    // Lower-level halves of request(), for pipelining several commands.
    std::expected<void, ClientError> send(const nlohmann::json& cmd);
    std::expected<nlohmann::json, ClientError> receive(int timeout_ms = kDefaultTimeoutMs);

private:
    int fd_ = -1;
    std::string pending_;  // bytes past the last returned line
};
