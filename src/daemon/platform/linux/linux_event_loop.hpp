#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/notify_indicator.hpp"
#include "platform/linux/posix_process_launcher.hpp"
#include "platform/linux/procfs_scanner.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "presence/presence_monitor.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    static std::unique_ptr<Summarizer> make_summarizer(const Config& config);
    void drain_presence_events();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    NotifyIndicator indicator_;
    PosixProcessLauncher launcher_;
    ProcfsScanner scanner_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;
    PresenceMonitor presence_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int presence_event_fd_ = -1;

    std::mutex presence_mutex_;
    std::deque<PresenceEvent> presence_events_;

    std::atomic<bool> running_{false};
};
