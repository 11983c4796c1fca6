#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

// Credentials live next to the default config; a custom config path keeps
// its own .env beside it when no config dir is known.
std::string credential_dir(const std::string& config_path) {
    auto dir = platform::config_dir();
    if (!dir.empty()) return dir;
    return std::filesystem::path(config_path).parent_path().string();
}

} // namespace

LinuxEventLoop::LinuxEventLoop(HubConfig config, std::string config_path,
                               BinaryLocator::SearchRoots roots, bool verbose)
    : verbose_(verbose),
      credentials_(credential_dir(config_path)),
      locator_(std::move(roots)),
      core_(std::move(config), std::move(config_path), verbose_,
            locator_, process_table_, credentials_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (reconcile_timer_fd_ >= 0) ::close(reconcile_timer_fd_);
    if (scan_timer_fd_ >= 0) ::close(scan_timer_fd_);
}

bool LinuxEventLoop::init() {
    // Signals are blocked before any child is spawned; children reset their mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    if (sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        std::println(stderr, "sigprocmask failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.listen(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (hotkeys, startup scan, auto-start, history db)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    reconcile_timer_fd_ = make_timer(kReconcileInterval);
    scan_timer_fd_ = make_timer(kScanInterval);
    if (reconcile_timer_fd_ < 0 || scan_timer_fd_ < 0) return false;

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.listen_fd(), EPOLLIN) ||
        !add_fd(reconcile_timer_fd_, EPOLLIN) ||
        !add_fd(scan_timer_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                drain(signal_fd_, sizeof(signalfd_siginfo));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.listen_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.drop_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == reconcile_timer_fd_) {
                drain(reconcile_timer_fd_, sizeof(uint64_t));
                core_.on_reconcile_tick();
                continue;
            }

            if (fd == scan_timer_fd_) {
                drain(scan_timer_fd_, sizeof(uint64_t));
                core_.on_scan_tick();
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::handle_client(int fd) {
    while (true) {
        auto read = ipc_server_.next_command(fd);
        switch (read.status) {
            case ReadStatus::Command: {
                auto response = core_.handle_request(read.command);
                if (!ipc_server_.reply(fd, response)) {
                    drop_client(fd);
                    return;
                }
                break;
            }
            case ReadStatus::Malformed:
                if (!ipc_server_.reply(fd, {{"status", "error"},
                                            {"kind", "bad_request"},
                                            {"message", "malformed command"}})) {
                    drop_client(fd);
                    return;
                }
                break;
            case ReadStatus::Incomplete:
                return;
            case ReadStatus::Disconnected:
                drop_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.drop_client(fd);
}

int LinuxEventLoop::make_timer(std::chrono::seconds interval) {
    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return -1;
    }

    itimerspec spec{};
    spec.it_value.tv_sec = interval.count();
    spec.it_interval.tv_sec = interval.count();
    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void LinuxEventLoop::drain(int fd, size_t size) {
    char buf[sizeof(signalfd_siginfo)];
    if (::read(fd, buf, size) < 0 && errno != EAGAIN) {
        std::println(stderr, "read failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolhub] {}", msg);
    }
}
