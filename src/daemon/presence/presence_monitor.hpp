#pragma once

#include "config.hpp"
#include "platform/process_scanner.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct PresenceEvent {
    enum class Kind { Entered, Exited };
    Kind kind;
    std::string app; // empty for Exited
};

// Polls the process table for a known meeting application and reports
// edge-triggered transitions only: one Entered when a meeting first shows up,
// one Exited when it goes away. Switching apps while present is not an edge.
class PresenceMonitor {
public:
    using EventCallback = std::function<void(PresenceEvent)>;

    PresenceMonitor(const ProcessScanner& scanner,
                    std::vector<Config::MeetingApp> apps,
                    std::vector<std::string> browser_processes);
    ~PresenceMonitor();

    PresenceMonitor(const PresenceMonitor&) = delete;
    PresenceMonitor& operator=(const PresenceMonitor&) = delete;

    // Name of the first configured app with a running process, if any.
    std::optional<std::string> detect() const;

    // One poll. Returns an event only on a presence edge.
    std::optional<PresenceEvent> poll_once();

    // Polls on a background thread, invoking `on_event` from that thread.
    void start(std::chrono::milliseconds interval, EventCallback on_event);
    void stop();

    bool meeting_present() const { return present_.load(std::memory_order_relaxed); }

private:
    const ProcessScanner& scanner_;
    std::vector<Config::MeetingApp> apps_;
    std::vector<std::string> browser_processes_; // lowercased

    std::atomic<bool> present_{false};

    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};
