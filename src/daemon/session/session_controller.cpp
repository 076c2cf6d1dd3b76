#include "session/session_controller.hpp"

#include "retry.hpp"
#include "transcript/merge.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <print>
#include <sstream>

namespace {

std::expected<std::string, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    std::ostringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

std::expected<void, std::string> write_file(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return std::unexpected("cannot write " + path + ": " + std::strerror(errno));
    f << text;
    if (!text.empty() && text.back() != '\n') f << '\n';
    f.flush();
    if (!f) return std::unexpected("write error on " + path);
    return {};
}

} // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Stopping: return "stopping";
        case SessionState::WaitingArtifacts: return "waiting_artifacts";
        case SessionState::Merging: return "merging";
        case SessionState::Summarizing: return "summarizing";
        case SessionState::Complete: return "complete";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* CycleOutcome::label() const {
    if (state == SessionState::Failed) return "failed";
    return partial ? "partial" : "complete";
}

SessionController::Timing SessionController::Timing::from_config(const Config::Timing& t) {
    return Timing{
        .settle = std::chrono::milliseconds(t.settle_ms),
        .stop_timeout = std::chrono::seconds(t.stop_timeout_s),
        .artifact_wait = std::chrono::seconds(t.artifact_wait_s),
        .artifact_poll = std::chrono::milliseconds(t.artifact_poll_ms),
    };
}

SessionController::SessionController(ProcessLauncher& launcher, Indicator& indicator,
                                     Summarizer* summarizer, std::vector<LaunchSpec> workers,
                                     ArtifactSet artifacts, Timing timing, bool verbose)
    : indicator_(indicator), summarizer_(summarizer),
      artifacts_(std::move(artifacts)), timing_(timing), verbose_(verbose),
      supervisor_(launcher, std::move(workers), timing.settle) {}

bool SessionController::can_start() const {
    auto s = state();
    return s == SessionState::Idle || s == SessionState::Complete || s == SessionState::Failed;
}

void SessionController::on_presence(const PresenceEvent& event) {
    std::lock_guard lock(mutex_);
    bool idle = can_start();

    if (event.kind == PresenceEvent::Kind::Entered) {
        meeting_app_ = event.app;
        log(event.app + " detected");
        indicator_.show();
        marker_visible_ = true;
        if (idle) {
            status_.store(StatusLabel::MeetingDetected, std::memory_order_release);
            indicator_.set_color(status_color(StatusLabel::MeetingDetected));
            indicator_.set_status(StatusLabel::MeetingDetected, event.app + " detected");
        }
        return;
    }

    meeting_app_.clear();
    log("meeting ended");
    // Keep the marker up while a cycle is in flight so it can still be stopped.
    if (idle) {
        status_.store(StatusLabel::NoMeeting, std::memory_order_release);
        indicator_.set_color(status_color(StatusLabel::NoMeeting));
        indicator_.set_status(StatusLabel::NoMeeting, "No meeting");
        indicator_.hide();
        marker_visible_ = false;
    }
}

std::expected<void, SessionError> SessionController::start_recording() {
    if (!can_start()) {
        return std::unexpected(SessionError{
            .kind = ErrorKind::SessionBusy,
            .message = std::string("busy: ") + session_state_name(state()),
        });
    }

    auto res = supervisor_.start();
    if (!res) {
        log("start failed: " + res.error().message);
        transition(SessionState::Idle, StatusLabel::Failed, res.error().message);
        return res;
    }

    {
        std::lock_guard lock(mutex_);
        record_start_ = std::chrono::steady_clock::now();
        cycle_app_ = meeting_app_;
    }
    transition(SessionState::Recording, StatusLabel::Recording, "Recording...");
    return {};
}

bool SessionController::begin_stop() {
    if (state() != SessionState::Recording) return false;

    {
        std::lock_guard lock(mutex_);
        record_stop_ = std::chrono::steady_clock::now();
    }
    transition(SessionState::Stopping, StatusLabel::Stopping, "Stopping...");
    return true;
}

CycleOutcome SessionController::finish_cycle() {
    CycleOutcome outcome;
    outcome.artifacts = artifacts_;
    {
        std::lock_guard lock(mutex_);
        outcome.app = cycle_app_;
        outcome.recording_duration =
            std::chrono::duration<double>(record_stop_ - record_start_).count();
    }

    // Stopping: the supervisor always resolves every handle, so this step
    // cannot fail the cycle.
    outcome.worker_exits = supervisor_.stop(timing_.stop_timeout);
    for (const auto& w : outcome.worker_exits) {
        log(std::format("{} worker finished with code {}{}", w.name, w.exit_code,
                        w.killed ? " (killed)" : ""));
    }

    transition(SessionState::WaitingArtifacts, StatusLabel::Processing, "Processing...");
    if (auto err = wait_for_artifacts()) {
        return fail(std::move(outcome), std::move(*err));
    }

    transition(SessionState::Merging, StatusLabel::Merging, "Merging...");
    transcript::MergeEngine merger(artifacts_);
    auto merged = merger.run();
    if (!merged) {
        return fail(std::move(outcome), merged.error());
    }
    outcome.combined_written = true;
    outcome.segment_count = merged->segment_count;
    log(std::format("combined transcript written: {} ({} segments)",
                    merged->combined_path, merged->segment_count));

    transition(SessionState::Summarizing, StatusLabel::Summarizing, "Summarizing...");
    std::optional<SessionError> summary_error;
    if (!summarizer_) {
        summary_error = SessionError{.kind = ErrorKind::SummaryUnavailable,
                                     .message = "summarization disabled"};
    } else if (auto text = read_file(artifacts_.combined); !text) {
        summary_error = SessionError{.kind = ErrorKind::SummaryUnavailable, .message = text.error()};
    } else if (auto summary = summarizer_->summarize(*text); !summary) {
        summary_error = SessionError{.kind = ErrorKind::SummaryUnavailable,
                                     .message = "summary failed: " + summary.error()};
    } else if (auto wrote = write_file(artifacts_.summary, *summary); !wrote) {
        summary_error = SessionError{.kind = ErrorKind::SummaryUnavailable, .message = wrote.error()};
    } else {
        outcome.summary_written = true;
    }

    outcome.state = SessionState::Complete;
    if (summary_error) {
        log(summary_error->message);
        outcome.partial = true;
        outcome.error = std::move(summary_error);
        transition(SessionState::Complete, StatusLabel::Partial,
                   "Partial: combined transcript saved, summary unavailable");
    } else {
        transition(SessionState::Complete, StatusLabel::Complete, "Complete!");
    }
    return outcome;
}

std::optional<CycleOutcome> SessionController::stop_recording() {
    if (!begin_stop()) return std::nullopt;
    return finish_cycle();
}

std::optional<SessionError> SessionController::wait_for_artifacts() {
    int polls = 0;
    std::vector<std::string> missing;

    bool found = poll_until(timing_.artifact_poll, timing_.artifact_wait, [&] {
        missing = artifacts_.missing_inputs();
        if (missing.empty()) return true;

        if (polls++ % 5 == 0) {
            log(std::format("waiting for transcripts, {} missing", missing.size()));
            report(StatusLabel::Processing, "Processing...");
        }
        return false;
    });

    if (found) {
        log("both transcript files found");
        return std::nullopt;
    }
    return missing_inputs_error(std::move(missing));
}

CycleOutcome SessionController::fail(CycleOutcome outcome, SessionError err) {
    log("cycle failed: " + err.message);
    outcome.state = SessionState::Failed;
    outcome.error = std::move(err);
    transition(SessionState::Failed, StatusLabel::Failed, outcome.error->message);
    return outcome;
}

double SessionController::recording_duration() const {
    if (state() != SessionState::Recording) return 0.0;
    std::lock_guard lock(mutex_);
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - record_start_).count();
}

std::string SessionController::meeting_app() const {
    std::lock_guard lock(mutex_);
    return meeting_app_;
}

bool SessionController::marker_visible() const {
    std::lock_guard lock(mutex_);
    return marker_visible_;
}

void SessionController::transition(SessionState next, StatusLabel label, const std::string& detail) {
    auto prev = state_.exchange(next, std::memory_order_acq_rel);
    if (prev != next) {
        log(std::format("{} -> {}", session_state_name(prev), session_state_name(next)));
    }
    report(label, detail);
}

void SessionController::report(StatusLabel label, const std::string& detail) {
    std::lock_guard lock(mutex_);
    status_.store(label, std::memory_order_release);
    indicator_.set_color(status_color(label));
    indicator_.set_status(label, detail);
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meeting-scribe] {}", msg);
    }
}
