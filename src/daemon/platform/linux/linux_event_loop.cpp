#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "summary/http_summarizer.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      indicator_(config_.indicator.notifications),
      core_(config_, verbose_, launcher_, indicator_, make_summarizer(config_), ipc_server_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }),
      presence_(scanner_, config_.presence.apps, config_.presence.browser_processes) {}

LinuxEventLoop::~LinuxEventLoop() {
    presence_.stop();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (presence_event_fd_ >= 0) ::close(presence_event_fd_);
}

std::unique_ptr<Summarizer> LinuxEventLoop::make_summarizer(const Config& config) {
    if (!config.summary.enabled) return nullptr;

    std::string api_key;
    if (!config.summary.api_key_env.empty()) {
        const char* key = std::getenv(config.summary.api_key_env.c_str());
        if (key) {
            api_key = key;
        } else {
            std::println(stderr, "summary: ${} is not set, sending no credentials",
                         config.summary.api_key_env);
        }
    }

    return std::make_unique<HttpSummarizer>(config.summary.url, config.summary.api_format,
                                            config.summary.model, api_key,
                                            config.summary.timeout_s);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (history db)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. Children unblock these before exec.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    presence_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0 || presence_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(presence_event_fd_, EPOLLIN)) {
        return false;
    }

    presence_.start(std::chrono::milliseconds(config_.presence.poll_ms), [this](PresenceEvent ev) {
        {
            std::lock_guard lock(presence_mutex_);
            presence_events_.push_back(std::move(ev));
        }
        uint64_t val = 1;
        if (::write(presence_event_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    });
    log("Watching for meeting applications");

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::drain_presence_events() {
    std::deque<PresenceEvent> events;
    {
        std::lock_guard lock(presence_mutex_);
        events.swap(presence_events_);
    }
    for (const auto& ev : events) {
        core_.on_presence(ev);
    }
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
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_ || fd == presence_event_fd_) {
                uint64_t val;
                if (::read(fd, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                if (fd == worker_event_fd_) core_.on_cycle_complete();
                else drain_presence_events();
                continue;
            }

            // Client fd
            nlohmann::json cmd;
            if (ipc_server_.read_command(fd, cmd)) {
                auto response = core_.handle_request(cmd);

                if (response.value("status", "") == "processing") {
                    core_.add_waiting_client(fd);
                } else {
                    ipc_server_.send_response(fd, response);
                }
            } else {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
                core_.remove_waiting_client(fd);
            }
        }
    }

    presence_.stop();
    core_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meeting-scribe] {}", msg);
    }
}
