#pragma once

#include "config.hpp"
#include "platform/indicator.hpp"
#include "platform/ipc_server.hpp"
#include "platform/process_launcher.hpp"
#include "presence/presence_monitor.hpp"
#include "session/session_controller.hpp"
#include "storage/history_db.hpp"
#include "summary/summarizer.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Portable daemon logic: turns IPC commands and presence events into session
// transitions, runs the blocking end of a cycle off the event-loop thread,
// and records finished cycles.
class DaemonCore {
public:
    // Called from the cycle thread when finish_cycle() returns; the platform
    // loop must then call on_cycle_complete() on its own thread.
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               ProcessLauncher& launcher, Indicator& indicator,
               std::unique_ptr<Summarizer> summarizer,
               IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history database (optional). `db_path` empty: platform default.
    bool init(const std::string& db_path = "");

    // Entry point for a decoded request. Never throws on malformed fields;
    // they come back as {"status":"error"} replies.
    nlohmann::json handle_request(const nlohmann::json& cmd);
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_presence(const PresenceEvent& event);
    void on_cycle_complete();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    SessionState session_state() const { return session_.state(); }

    // Stops a live recording through the normal protocol and waits for any
    // cycle in flight.
    void shutdown();

    // Builds worker launch specs from the config.
    static std::vector<LaunchSpec> worker_specs(const Config& config);
    static nlohmann::json outcome_json(const CycleOutcome& outcome);

private:
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    void start_cycle_worker();
    void record_history(const CycleOutcome& outcome);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    Indicator& indicator_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    std::unique_ptr<Summarizer> summarizer_;
    SessionController session_;
    HistoryDb history_db_;

    std::vector<int> waiting_clients_;

    std::optional<CycleOutcome> cycle_result_;
    std::jthread worker_;
};
