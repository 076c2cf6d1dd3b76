#pragma once

#include "platform/indicator.hpp"

#include <expected>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

// Tracks marker visibility and color for status queries, and raises a
// desktop notification (notify-send) for the transitions a user acts on.
// notify-send is never waited for; set_status() returns once it has exec'd
// and finished children are reaped on later calls.
class NotifyIndicator : public Indicator {
public:
    explicit NotifyIndicator(bool notifications = true);
    ~NotifyIndicator() override;

    NotifyIndicator(const NotifyIndicator&) = delete;
    NotifyIndicator& operator=(const NotifyIndicator&) = delete;

    void show() override;
    void hide() override;
    void set_color(const std::string& color) override;
    void set_status(StatusLabel label, const std::string& detail) override;

    bool visible() const;
    std::string color() const;

    // Collects notify-send children that have exited. A failing one turns
    // notifications off.
    void reap();
    bool notifications_enabled() const;
    size_t pending() const;

private:
    static bool should_notify(StatusLabel label);
    std::expected<void, std::string> notify(const std::string& summary, const std::string& body);
    void reap_locked();
    void disable_locked(const std::string& reason);

    mutable std::mutex notify_mutex_;
    bool notifications_;
    bool notify_broken_ = false;
    std::vector<pid_t> pending_;

    mutable std::mutex mutex_;
    bool visible_ = false;
    std::string color_ = "gray";
};
