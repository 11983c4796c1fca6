#include "platform/linux/env_file_credential_store.hpp"

#include "tool_catalog.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string key_prefix() {
    return std::string(kCredentialEnvVar) + "=";
}

} // namespace

EnvFileCredentialStore::EnvFileCredentialStore(std::string dir)
    : dir_(std::move(dir)), path_(dir_ + "/.env") {}

std::optional<std::string> EnvFileCredentialStore::load() const {
    auto prefix = key_prefix();
    for (auto& line : read_lines()) {
        if (line.starts_with(prefix)) {
            auto value = line.substr(prefix.size());
            if (value.empty()) return std::nullopt;
            return value;
        }
    }
    return std::nullopt;
}

std::expected<void, std::string> EnvFileCredentialStore::save(const std::string& secret) {
    if (secret.empty()) return std::unexpected("empty credential");
    if (secret.find('\n') != std::string::npos) return std::unexpected("credential contains a newline");

    auto prefix = key_prefix();
    auto lines = read_lines();
    std::erase_if(lines, [&](const std::string& l) { return l.starts_with(prefix); });
    lines.push_back(prefix + secret);
    return write_lines(lines);
}

std::expected<void, std::string> EnvFileCredentialStore::remove() {
    auto prefix = key_prefix();
    auto lines = read_lines();
    auto removed = std::erase_if(lines, [&](const std::string& l) { return l.starts_with(prefix); });
    if (removed == 0) return {};

    if (lines.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) return std::unexpected("remove " + path_ + ": " + ec.message());
        return {};
    }
    return write_lines(lines);
}

std::vector<std::string> EnvFileCredentialStore::read_lines() const {
    std::vector<std::string> lines;
    std::ifstream f(path_);
    if (!f.is_open()) return lines;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
    }
    return lines;
}

std::expected<void, std::string> EnvFileCredentialStore::write_lines(const std::vector<std::string>& lines) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return std::unexpected("create " + dir_ + ": " + ec.message());

    std::string content;
    for (auto& l : lines) content += l + '\n';

    // Owner-only from the first byte: the secret is never readable by others,
    // not even between create and chmod.
    auto tmp = path_ + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return std::unexpected("open " + tmp + ": " + std::strerror(errno));

    auto fail = [&](const char* what) {
        std::string msg = std::string(what) + " " + tmp + ": " + std::strerror(errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return std::unexpected(msg);
    };

    // O_CREAT's mode only applies to a new file; a leftover tmp keeps its own.
    if (::fchmod(fd, 0600) < 0) return fail("chmod");

    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("write");
        }
        off += static_cast<size_t>(n);
    }
    if (::fsync(fd) < 0) return fail("fsync");
    if (::close(fd) < 0) {
        std::string msg = "close " + tmp + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return std::unexpected(msg);
    }

    if (::rename(tmp.c_str(), path_.c_str()) < 0) {
        std::string msg = "rename " + tmp + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return std::unexpected(msg);
    }
    return {};
}
