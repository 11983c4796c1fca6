#pragma once

#include "platform/credential_store.hpp"

#include <string>
#include <vector>

// Keeps the secret as OPENAI_API_KEY=<secret> in <dir>/.env. Other lines in
// the file are preserved.
class EnvFileCredentialStore : public CredentialStore {
public:
    explicit EnvFileCredentialStore(std::string dir);

    std::optional<std::string> load() const override;
    std::expected<void, std::string> save(const std::string& secret) override;
    std::expected<void, std::string> remove() override;

    const std::string& path() const { return path_; }

private:
    std::vector<std::string> read_lines() const;
    std::expected<void, std::string> write_lines(const std::vector<std::string>& lines);

    std::string dir_;
    std::string path_;
};
