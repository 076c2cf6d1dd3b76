#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       ProcessLauncher& launcher, Indicator& indicator,
                       std::unique_ptr<Summarizer> summarizer,
                       IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      indicator_(indicator), ipc_(ipc),
      notify_(std::move(notify)),
      summarizer_(std::move(summarizer)),
      session_(launcher, indicator_, summarizer_.get(), worker_specs(config_),
               config_.artifact_paths(), SessionController::Timing::from_config(config_.timing),
               verbose_) {}

DaemonCore::~DaemonCore() = default;

std::vector<LaunchSpec> DaemonCore::worker_specs(const Config& config) {
    auto dir = config.workers.working_dir;
    return {
        LaunchSpec{.name = "mic", .argv = config.workers.mic_command,
                   .working_dir = dir, .env = config.workers.env},
        LaunchSpec{.name = "speaker", .argv = config.workers.speaker_command,
                   .working_dir = dir, .env = config.workers.env},
    };
}

bool DaemonCore::init(const std::string& db_path) {
    std::string path = db_path;
    if (path.empty()) {
        auto data = platform::data_dir();
        path = data.empty() ? "/tmp/meeting-scribe/history.db" : data + "/history.db";
    }
    if (!history_db_.open(path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    if (!summarizer_) {
        log("Summaries disabled");
    }
    return true;
}

nlohmann::json DaemonCore::handle_request(const nlohmann::json& cmd) {
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing or non-string \"cmd\""}};
    }

    try {
        return handle_command(it->get<std::string>(), cmd);
    } catch (const nlohmann::json::exception& e) {
        log(std::string("Bad request: ") + e.what());
        return {{"status", "error"}, {"message", std::string("bad request: ") + e.what()}};
    }
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    if (session_.state() == SessionState::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& /*cmd*/) {
    if (!session_.can_start()) {
        return {{"status", "error"},
                {"error", error_kind_name(ErrorKind::SessionBusy)},
                {"message", std::string("busy: ") + session_state_name(session_.state())}};
    }

    // The previous cycle's thread has reported back by now; reap it.
    if (worker_.joinable()) worker_.join();

    auto res = session_.start_recording();
    if (!res) {
        auto& err = res.error();
        if (err.kind == ErrorKind::SessionBusy) {
            return {{"status", "error"}, {"error", error_kind_name(err.kind)}, {"message", err.message}};
        }
        record_history(CycleOutcome{
            .state = SessionState::Failed,
            .error = err,
            .app = session_.meeting_app(),
        });
        return {{"status", "error"},
                {"error", error_kind_name(err.kind)},
                {"message", err.message},
                {"worker", err.worker},
                {"exit_code", err.exit_code}};
    }

    log("Recording started" + (session_.meeting_app().empty() ? "" : " (" + session_.meeting_app() + ")"));
    return {{"status", "ok"}, {"state", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (!session_.begin_stop()) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    log("Recording stopped, processing...");
    start_cycle_worker();

    // Reply is deferred until the cycle finishes.
    return {{"status", "processing"}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto state = session_.state();
    auto label = session_.status();
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", session_state_name(state)},
        {"label", status_name(label)},
        {"color", status_color(label)},
        {"visible", session_.marker_visible()},
        {"meeting", session_.meeting_app()},
    };
    if (state == SessionState::Recording) {
        resp["duration"] = session_.recording_duration();
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end()) {
        if (!it->is_number_integer()) {
            return {{"status", "error"}, {"message", "\"limit\" must be an integer"}};
        }
        limit = it->get<int>();
    }
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"app", e.app},
            {"outcome", e.outcome},
            {"recording_duration", e.recording_duration},
            {"segment_count", e.segment_count},
            {"combined_path", e.combined_path},
            {"summary_path", e.summary_path},
            {"error", e.error},
        });
    }
    return resp;
}

void DaemonCore::start_cycle_worker() {
    cycle_result_.reset();

    worker_ = std::jthread([this](std::stop_token) {
        cycle_result_ = session_.finish_cycle();
        notify_();
    });
}

void DaemonCore::on_cycle_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!cycle_result_) return;

    auto& outcome = *cycle_result_;
    log(std::format("Cycle {}: {} segments", outcome.label(), outcome.segment_count));
    record_history(outcome);

    auto response = outcome_json(outcome);
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
    cycle_result_.reset();
}

nlohmann::json DaemonCore::outcome_json(const CycleOutcome& outcome) {
    nlohmann::json resp = {
        {"status", outcome.state == SessionState::Failed ? "error" : "ok"},
        {"outcome", outcome.label()},
        {"segments", outcome.segment_count},
        {"duration", outcome.recording_duration},
        {"combined", outcome.combined_written ? outcome.artifacts.combined : ""},
        {"summary", outcome.summary_written ? outcome.artifacts.summary : ""},
    };

    nlohmann::json workers = nlohmann::json::array();
    for (const auto& w : outcome.worker_exits) {
        workers.push_back({{"name", w.name}, {"exit_code", w.exit_code}, {"killed", w.killed}});
    }
    resp["workers"] = std::move(workers);

    if (outcome.error) {
        resp["error"] = error_kind_name(outcome.error->kind);
        resp["message"] = outcome.error->message;
        resp["missing"] = outcome.error->kind == ErrorKind::MissingInputs
                              ? outcome.error->paths
                              : std::vector<std::string>{};
    }
    return resp;
}

void DaemonCore::record_history(const CycleOutcome& outcome) {
    if (!history_db_.is_open()) return;

    bool start_failed = outcome.error && outcome.error->kind == ErrorKind::WorkerStartFailed;
    history_db_.insert(HistoryEntry{
        .app = outcome.app,
        .outcome = start_failed ? "start_failed" : outcome.label(),
        .recording_duration = outcome.recording_duration,
        .segment_count = static_cast<int64_t>(outcome.segment_count),
        .combined_path = outcome.combined_written ? outcome.artifacts.combined : "",
        .summary_path = outcome.summary_written ? outcome.artifacts.summary : "",
        .error = outcome.error ? outcome.error->message : "",
    });
}

void DaemonCore::on_presence(const PresenceEvent& event) {
    session_.on_presence(event);
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        log("Shutting down while recording, stopping workers...");
        if (session_.begin_stop()) {
            cycle_result_ = session_.finish_cycle();
            on_cycle_complete();
        }
        return;
    }

    if (worker_.joinable()) {
        log("Waiting for the current cycle to finish...");
        worker_.join();
        on_cycle_complete();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meeting-scribe] {}", msg);
    }
}
