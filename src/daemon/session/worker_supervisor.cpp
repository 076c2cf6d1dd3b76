#include "session/worker_supervisor.hpp"

#include "retry.hpp"

#include <algorithm>
#include <print>

WorkerSupervisor::WorkerSupervisor(ProcessLauncher& launcher, std::vector<LaunchSpec> specs,
                                   std::chrono::milliseconds settle_delay)
    : launcher_(launcher), specs_(std::move(specs)), settle_delay_(settle_delay) {}

WorkerSupervisor::~WorkerSupervisor() {
    terminate_all();
}

std::expected<void, SessionError> WorkerSupervisor::start() {
    if (running()) {
        return std::unexpected(SessionError{.kind = ErrorKind::WorkerStartFailed,
                                            .message = "workers already running"});
    }

    for (const auto& spec : specs_) {
        auto proc = launcher_.launch(spec);
        if (!proc) {
            std::println(stderr, "supervisor: {}", proc.error());
            terminate_all();
            return std::unexpected(SessionError{
                .kind = ErrorKind::WorkerStartFailed,
                .message = proc.error(),
                .worker = spec.name,
                .exit_code = -1,
            });
        }
        workers_.push_back({spec.name, std::move(*proc)});
    }

    poll_until(std::chrono::milliseconds(50), settle_delay_, [this] {
        return std::ranges::any_of(workers_, [](Worker& w) { return w.process->poll().has_value(); });
    });

    for (auto& w : workers_) {
        if (auto code = w.process->poll()) {
            std::println(stderr, "supervisor: {} worker exited immediately with code {}", w.name, *code);
            SessionError err{
                .kind = ErrorKind::WorkerStartFailed,
                .message = w.name + " worker failed to start (exit code " + std::to_string(*code) + ")",
                .worker = w.name,
                .exit_code = *code,
            };
            terminate_all();
            return std::unexpected(std::move(err));
        }
    }

    return {};
}

std::vector<WorkerExit> WorkerSupervisor::stop(std::chrono::milliseconds timeout) {
    std::vector<WorkerExit> exits;

    // Phase 1: ask every worker to flush and exit.
    for (auto& w : workers_) {
        if (auto res = w.process->interrupt(); !res) {
            std::println(stderr, "supervisor: interrupting {} failed: {}, killing", w.name, res.error());
            if (auto k = w.process->kill(); !k) {
                std::println(stderr, "supervisor: killing {} failed: {}", w.name, k.error());
            }
        }
    }

    // Phase 2: bounded wait per worker, then force.
    for (auto& w : workers_) {
        WorkerExit exit{.name = w.name};
        if (auto code = w.process->wait_for(timeout)) {
            exit.exit_code = *code;
        } else {
            std::println(stderr, "supervisor: {} timed out, killing", w.name);
            if (auto k = w.process->kill(); !k) {
                std::println(stderr, "supervisor: killing {} failed: {}", w.name, k.error());
            }
            exit.exit_code = w.process->wait();
            exit.killed = true;
        }

        if (exit.exit_code != 0) {
            std::println(stderr, "supervisor: {} finished with code {}", w.name, exit.exit_code);
        }
        exits.push_back(std::move(exit));
    }

    workers_.clear();
    return exits;
}

std::vector<int> WorkerSupervisor::pids() const {
    std::vector<int> out;
    for (const auto& w : workers_) out.push_back(w.process->pid());
    return out;
}

void WorkerSupervisor::terminate_all() {
    for (auto& w : workers_) {
        if (!w.process->poll()) {
            if (auto k = w.process->kill(); !k) {
                std::println(stderr, "supervisor: killing {} failed: {}", w.name, k.error());
            }
            w.process->wait();
        }
    }
    workers_.clear();
}
