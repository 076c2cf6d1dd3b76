#pragma once

#include "platform/process_launcher.hpp"

#include <sys/types.h>

// fork + execvp child in its own process group. Signals go to the whole
// group so a worker's own children see the interrupt too.
class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid);
    ~PosixChildProcess() override;

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    int pid() const override { return pid_; }
    std::optional<int> poll() override;
    std::expected<void, std::string> interrupt() override;
    std::expected<void, std::string> kill() override;
    std::optional<int> wait_for(std::chrono::milliseconds timeout) override;
    int wait() override;

private:
    std::expected<void, std::string> signal_group(int sig);
    static int decode_status(int status);

    pid_t pid_;
    std::optional<int> exit_code_;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::expected<std::unique_ptr<ChildProcess>, std::string>
        launch(const LaunchSpec& spec) override;
};
