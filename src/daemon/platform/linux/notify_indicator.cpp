#include "platform/linux/notify_indicator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

NotifyIndicator::NotifyIndicator(bool notifications)
    : notifications_(notifications) {}

NotifyIndicator::~NotifyIndicator() {
    std::lock_guard lock(notify_mutex_);
    reap_locked();
}

void NotifyIndicator::show() {
    std::lock_guard lock(mutex_);
    visible_ = true;
}

void NotifyIndicator::hide() {
    std::lock_guard lock(mutex_);
    visible_ = false;
}

void NotifyIndicator::set_color(const std::string& color) {
    std::lock_guard lock(mutex_);
    color_ = color;
}

bool NotifyIndicator::visible() const {
    std::lock_guard lock(mutex_);
    return visible_;
}

std::string NotifyIndicator::color() const {
    std::lock_guard lock(mutex_);
    return color_;
}

bool NotifyIndicator::notifications_enabled() const {
    std::lock_guard lock(notify_mutex_);
    return notifications_ && !notify_broken_;
}

size_t NotifyIndicator::pending() const {
    std::lock_guard lock(notify_mutex_);
    return pending_.size();
}

bool NotifyIndicator::should_notify(StatusLabel label) {
    switch (label) {
        case StatusLabel::MeetingDetected:
        case StatusLabel::Recording:
        case StatusLabel::Complete:
        case StatusLabel::Partial:
        case StatusLabel::Failed:
            return true;
        default:
            return false;
    }
}

void NotifyIndicator::set_status(StatusLabel label, const std::string& detail) {
    std::lock_guard lock(notify_mutex_);
    reap_locked();
    if (!notifications_ || notify_broken_ || !should_notify(label)) return;

    auto res = notify(std::string("Meeting scribe: ") + status_name(label), detail);
    if (!res) disable_locked(res.error());
}

void NotifyIndicator::reap() {
    std::lock_guard lock(notify_mutex_);
    reap_locked();
}

void NotifyIndicator::reap_locked() {
    std::erase_if(pending_, [this](pid_t pid) {
        int status;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == 0) return false;
        if (r < 0) return errno != EINTR;

        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            disable_locked("notify-send exited with code " + std::to_string(WEXITSTATUS(status)));
        }
        return true;
    });
}

void NotifyIndicator::disable_locked(const std::string& reason) {
    if (notify_broken_) return;
    std::println(stderr, "indicator: {}, disabling notifications", reason);
    notify_broken_ = true;
}

std::expected<void, std::string> NotifyIndicator::notify(const std::string& summary,
                                                         const std::string& body) {
    // Closed by a successful exec; an exec failure writes errno into it.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::close(err_pipe[0]);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execlp("notify-send", "notify-send", "-a", "meeting-scribe",
                 summary.c_str(), body.c_str(), nullptr);
        int exec_errno = errno;
        [[maybe_unused]] auto n = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0) {
        // The child is already on its way out.
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return std::unexpected(std::string("cannot run notify-send: ") + std::strerror(exec_errno));
    }

    pending_.push_back(pid);
    return {};
}
