#include "presence/presence_monitor.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

PresenceMonitor::PresenceMonitor(const ProcessScanner& scanner,
                                 std::vector<Config::MeetingApp> apps,
                                 std::vector<std::string> browser_processes)
    : scanner_(scanner), apps_(std::move(apps)) {
    for (auto& b : browser_processes) {
        browser_processes_.push_back(lower(std::move(b)));
    }
}

PresenceMonitor::~PresenceMonitor() {
    stop();
}

std::optional<std::string> PresenceMonitor::detect() const {
    std::unordered_set<std::string> running;
    for (auto& name : scanner_.process_names()) {
        running.insert(lower(std::move(name)));
    }

    for (const auto& app : apps_) {
        for (const auto& proc : app.processes) {
            auto name = lower(proc);
            // A bare browser is not evidence of a meeting.
            if (std::ranges::find(browser_processes_, name) != browser_processes_.end()) continue;
            if (running.contains(name)) return app.name;
        }
    }
    return std::nullopt;
}

std::optional<PresenceEvent> PresenceMonitor::poll_once() {
    auto app = detect();
    bool was_present = present_.load(std::memory_order_relaxed);

    if (app && !was_present) {
        present_.store(true, std::memory_order_relaxed);
        return PresenceEvent{PresenceEvent::Kind::Entered, *app};
    }
    if (!app && was_present) {
        present_.store(false, std::memory_order_relaxed);
        return PresenceEvent{PresenceEvent::Kind::Exited, {}};
    }
    return std::nullopt;
}

void PresenceMonitor::start(std::chrono::milliseconds interval, EventCallback on_event) {
    stop();
    thread_ = std::jthread([this, interval, on_event = std::move(on_event)](std::stop_token st) {
        while (!st.stop_requested()) {
            if (auto ev = poll_once()) on_event(std::move(*ev));

            std::unique_lock lock(mutex_);
            wake_.wait_for(lock, st, interval, [] { return false; });
        }
    });
}

void PresenceMonitor::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}
