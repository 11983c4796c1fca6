#pragma once

#include <expected>
#include <optional>
#include <string>

// The single shared secret handed to tools that need it.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;
    virtual std::optional<std::string> load() const = 0;
    virtual std::expected<void, std::string> save(const std::string& secret) = 0;
    virtual std::expected<void, std::string> remove() = 0;
};
