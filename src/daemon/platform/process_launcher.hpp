#pragma once

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct LaunchSpec {
    std::string name; // "mic" / "speaker", for logs and errors
    std::vector<std::string> argv;
    std::string working_dir;
    std::map<std::string, std::string> env; // added to the inherited environment
};

// A running child. Owned by exactly one WorkerSupervisor.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;

    // Reaps the child if it has exited. Returns its exit code, or nullopt while
    // it is still running. Death by signal N reports 128 + N.
    virtual std::optional<int> poll() = 0;

    // Cooperative interrupt (Ctrl-C semantics).
    virtual std::expected<void, std::string> interrupt() = 0;

    virtual std::expected<void, std::string> kill() = 0;

    // Waits up to `timeout` for exit. nullopt if still running afterwards.
    virtual std::optional<int> wait_for(std::chrono::milliseconds timeout) = 0;

    // Waits without bound.
    virtual int wait() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual std::expected<std::unique_ptr<ChildProcess>, std::string>
        launch(const LaunchSpec& spec) = 0;
};
