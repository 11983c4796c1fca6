#pragma once

#include "binary_locator.hpp"
#include "config.hpp"
#include "hub_core.hpp"
#include "platform/linux/env_file_credential_store.hpp"
#include "platform/linux/procfs_process_table.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <chrono>
#include <string>

class LinuxEventLoop {
public:
    static constexpr auto kReconcileInterval = std::chrono::seconds(2);
    static constexpr auto kScanInterval = std::chrono::seconds(30);

    LinuxEventLoop(HubConfig config, std::string config_path,
                   BinaryLocator::SearchRoots roots, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    int make_timer(std::chrono::seconds interval);
    void drain(int fd, size_t size);

    void log(const std::string& msg);

    bool verbose_;

    // Platform implementations (constructed before core_)
    ProcfsProcessTable process_table_;
    EnvFileCredentialStore credentials_;
    BinaryLocator locator_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    HubCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int reconcile_timer_fd_ = -1;
    int scan_timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
