#pragma once

#include "platform/process_launcher.hpp"
#include "session_error.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

struct WorkerExit {
    std::string name;
    int exit_code = 0;
    bool killed = false; // ignored the interrupt and had to be killed
};

// Sole owner of the capture worker processes. Nothing else may signal or
// wait on them.
class WorkerSupervisor {
public:
    WorkerSupervisor(ProcessLauncher& launcher, std::vector<LaunchSpec> specs,
                     std::chrono::milliseconds settle_delay);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    // Launches every worker, then watches them for the settle delay. If any
    // exits in that window the rest are killed and no handle is kept.
    std::expected<void, SessionError> start();

    // Interrupts all live workers, waits up to `timeout` for each, kills
    // stragglers. Always leaves the handle table empty.
    std::vector<WorkerExit> stop(std::chrono::milliseconds timeout);

    bool running() const { return !workers_.empty(); }
    std::vector<int> pids() const;

private:
    struct Worker {
        std::string name;
        std::unique_ptr<ChildProcess> process;
    };

    void terminate_all();

    ProcessLauncher& launcher_;
    std::vector<LaunchSpec> specs_;
    std::chrono::milliseconds settle_delay_;
    std::vector<Worker> workers_;
};
