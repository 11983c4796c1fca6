#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Command,       // one complete command was parsed
    Incomplete,    // no full line buffered yet
    Malformed,     // a full line arrived but is not a JSON object
    Disconnected,  // peer closed, the read failed, or the line grew too long
};

struct ReadResult {
    ReadStatus status = ReadStatus::Incomplete;
    nlohmann::json command;
};

// Accepts control clients and exchanges one JSON object per line with them.
class CommandServer {
public:
    virtual ~CommandServer() = default;

    // Fails if another hub already answers on `endpoint`.
    virtual bool listen(const std::string& endpoint) = 0;
    virtual void shutdown() = 0;
    virtual int listen_fd() const = 0;

    // -1 when nothing is pending or the client limit is reached.
    virtual int accept_client() = 0;
    // Buffered commands come first; the socket is only read when none is left.
    virtual ReadResult next_command(int client_fd) = 0;
    virtual bool reply(int client_fd, const nlohmann::json& response) = 0;
    virtual void drop_client(int client_fd) = 0;
    virtual size_t client_count() const = 0;
};
