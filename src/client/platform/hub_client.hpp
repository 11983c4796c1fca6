#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

enum class ClientError {
    NotRunning,   // nothing listens on the endpoint
    SendFailed,
    Timeout,
    Closed,       // the hub hung up before answering
    BadResponse,  // the answer was not JSON
};

std::string_view client_error_message(ClientError err);

// Request/response connection to a running hub.
class HubClient {
public:
    // Stopping every tool can take a few seconds per tool.
    static constexpr int kDefaultTimeoutMs = 30000;

    virtual ~HubClient() = default;

    virtual std::expected<void, ClientError> connect(const std::string& endpoint) = 0;
    virtual std::expected<nlohmann::json, ClientError> request(const nlohmann::json& cmd,
                                                               int timeout_ms = kDefaultTimeoutMs) = 0;
    virtual void close() = 0;
};
