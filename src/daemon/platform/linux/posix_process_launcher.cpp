#include "platform/linux/posix_process_launcher.hpp"

#include "retry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

PosixChildProcess::PosixChildProcess(pid_t pid) : pid_(pid) {}

PosixChildProcess::~PosixChildProcess() {
    if (!poll()) {
        std::println(stderr, "process: pid {} still running at teardown, killing", pid_);
        (void)kill();
        wait();
    }
}

int PosixChildProcess::decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::optional<int> PosixChildProcess::poll() {
    if (exit_code_) return exit_code_;

    int status;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_code_ = decode_status(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait on.
        exit_code_ = -1;
    }
    return exit_code_;
}

std::expected<void, std::string> PosixChildProcess::signal_group(int sig) {
    if (poll()) return {};

    if (::kill(-pid_, sig) == 0) return {};
    // Group may not exist if setpgid lost a race; fall back to the pid.
    if (::kill(pid_, sig) == 0) return {};
    if (errno == ESRCH) return {};
    return std::unexpected(std::string("kill(") + strsignal(sig) + ") failed: " + std::strerror(errno));
}

std::expected<void, std::string> PosixChildProcess::interrupt() {
    return signal_group(SIGINT);
}

std::expected<void, std::string> PosixChildProcess::kill() {
    return signal_group(SIGKILL);
}

std::optional<int> PosixChildProcess::wait_for(std::chrono::milliseconds timeout) {
    poll_until(std::chrono::milliseconds(20), timeout, [this] { return poll().has_value(); });
    return exit_code_;
}

int PosixChildProcess::wait() {
    if (exit_code_) return *exit_code_;

    int status;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) continue;
        exit_code_ = -1;
        return *exit_code_;
    }
    exit_code_ = decode_status(status);
    return *exit_code_;
}

std::expected<std::unique_ptr<ChildProcess>, std::string>
PosixProcessLauncher::launch(const LaunchSpec& spec) {
    if (spec.argv.empty()) {
        return std::unexpected(spec.name + ": empty command");
    }

    // Everything the child needs is built before fork(); after it only
    // async-signal-safe calls are made.
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto key = entry.substr(0, entry.find('='));
        if (!spec.env.contains(key)) env_strings.push_back(std::move(entry));
    }
    for (const auto& [key, value] : spec.env) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    const char* cwd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(spec.name + ": fork() failed: " + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        // The daemon blocks SIGINT/SIGTERM for its signalfd; the mask survives
        // exec, so workers would never see the interrupt.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }

        if (cwd && ::chdir(cwd) < 0) ::_exit(127);

        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    return std::make_unique<PosixChildProcess>(pid);
}
