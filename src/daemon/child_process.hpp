#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

struct LaunchCommand {
    std::filesystem::path path;
    std::vector<std::string> args;                            // not including argv[0]
    std::vector<std::pair<std::string, std::string>> env;     // added on top of our environment
    std::filesystem::path stderr_log;  // truncated per launch; empty = anonymous memfd
};

struct ExitStatus {
    int code = -1;   // exit code, valid when signal == 0
    int signal = 0;  // terminating signal, 0 if the process exited normally

    // "Process exited with code 3" / "Process terminated by signal 9"
    std::string describe() const;
};

// Exclusive handle on a spawned child. stdin/stdout go to /dev/null, stderr
// goes to a file the child can never block on. The handle keeps a read fd on
// that file until release_stderr(). The destructor never kills or reaps;
// whoever owns the handle decides when the child ends.
class ChildProcess {
public:
    // Fails if the stderr file, pipe or fork fails, or the executable cannot be exec'd.
    static std::expected<ChildProcess, std::string> spawn(const LaunchCommand& cmd);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking. std::nullopt while the child is still running.
    std::expected<std::optional<ExitStatus>, std::string> try_wait();

    // Blocks until the child exits.
    std::expected<ExitStatus, std::string> wait();

    // No-op once the child has been reaped, so a recycled PID is never hit.
    std::expected<void, std::string> send_signal(int sig);

    // Start of what the child has written to stderr so far, at most `limit` bytes.
    std::string captured_stderr(size_t limit = 64 * 1024) const;

    // Closes our fd on the stderr file; the child keeps writing to its own.
    void release_stderr();
    bool has_stderr() const { return stderr_fd_ >= 0; }

private:
    ChildProcess(pid_t pid, int stderr_fd);

    pid_t pid_ = -1;
    int stderr_fd_ = -1;
    std::optional<ExitStatus> exit_;
};
