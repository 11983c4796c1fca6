#include "child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <signal.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

ExitStatus decode_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.signal = WTERMSIG(status);
    }
    return st;
}

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Inherited environment with `overrides` replacing any existing entries.
std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        bool replaced = std::ranges::any_of(overrides, [&](const auto& kv) {
            return entry.size() > kv.first.size() && entry.starts_with(kv.first) &&
                   entry[kv.first.size()] == '=';
        });
        if (!replaced) env.emplace_back(entry);
    }
    for (auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

} // namespace

std::string ExitStatus::describe() const {
    if (signal != 0) return std::format("Process terminated by signal {}", signal);
    return std::format("Process exited with code {}", code);
}

std::expected<ChildProcess, std::string> ChildProcess::spawn(const LaunchCommand& cmd) {
    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_strings;
    argv_strings.push_back(cmd.path.string());
    argv_strings.insert(argv_strings.end(), cmd.args.begin(), cmd.args.end());
    auto env_strings = build_environment(cmd.env);
    auto argv = to_cstrings(argv_strings);
    auto envp = to_cstrings(env_strings);

    int capture_fd = cmd.stderr_log.empty()
        ? ::memfd_create("toolhub-stderr", MFD_CLOEXEC)
        : ::open(cmd.stderr_log.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (capture_fd < 0) {
        return std::unexpected(errno_message(cmd.stderr_log.empty() ? "memfd_create()" : "open()"));
    }

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe2()");
        ::close(capture_fd);
        return std::unexpected(msg);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(capture_fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // The hub blocks SIGINT/SIGTERM for its signalfd; the mask survives exec.
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::dup2(capture_fd, STDERR_FILENO);

        ::execve(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(err_pipe[1]);

    // The error pipe closes on a successful exec; a payload means exec failed.
    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(err_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        ::close(capture_fd);
        return std::unexpected(std::format("exec {} failed: {}", cmd.path.string(),
                                           std::strerror(child_errno)));
    }

    return ChildProcess(pid, capture_fd);
}

ChildProcess::ChildProcess(pid_t pid, int stderr_fd)
    : pid_(pid), stderr_fd_(stderr_fd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      exit_(std::exchange(other.exit_, std::nullopt)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release_stderr();
        pid_ = std::exchange(other.pid_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        exit_ = std::exchange(other.exit_, std::nullopt);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release_stderr();
}

std::expected<std::optional<ExitStatus>, std::string> ChildProcess::try_wait() {
    if (exit_) return exit_;
    if (pid_ <= 0) return std::unexpected("no child process");

    int status = 0;
    pid_t r;
    while ((r = ::waitpid(pid_, &status, WNOHANG)) < 0 && errno == EINTR) {}

    if (r == 0) return std::optional<ExitStatus>{};
    if (r < 0) return std::unexpected(errno_message("waitpid()"));

    exit_ = decode_status(status);
    return exit_;
}

std::expected<ExitStatus, std::string> ChildProcess::wait() {
    if (exit_) return *exit_;
    if (pid_ <= 0) return std::unexpected("no child process");

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    exit_ = decode_status(status);
    return *exit_;
}

std::expected<void, std::string> ChildProcess::send_signal(int sig) {
    if (exit_) return {};
    if (pid_ <= 0) return std::unexpected("no child process");

    if (::kill(pid_, sig) < 0) {
        return std::unexpected(errno_message("kill()"));
    }
    return {};
}

std::string ChildProcess::captured_stderr(size_t limit) const {
    std::string out;
    if (stderr_fd_ < 0) return out;

    // pread: the file offset is shared with the child's stderr.
    char buf[4096];
    while (out.size() < limit) {
        size_t want = std::min(sizeof(buf), limit - out.size());
        ssize_t n = ::pread(stderr_fd_, buf, want, static_cast<off_t>(out.size()));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    return out;
}

void ChildProcess::release_stderr() {
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}
