#pragma once

#include "artifacts.hpp"
#include "config.hpp"
#include "platform/indicator.hpp"
#include "platform/process_launcher.hpp"
#include "presence/presence_monitor.hpp"
#include "session/worker_supervisor.hpp"
#include "session_error.hpp"
#include "summary/summarizer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class SessionState {
    Idle,
    Recording,
    Stopping,
    WaitingArtifacts,
    Merging,
    Summarizing,
    Complete,
    Failed,
};

const char* session_state_name(SessionState state);

struct CycleOutcome {
    SessionState state = SessionState::Failed; // Complete or Failed
    bool partial = false;                      // Complete without a summary
    std::optional<SessionError> error;
    std::vector<WorkerExit> worker_exits;
    ArtifactSet artifacts;
    bool combined_written = false;
    bool summary_written = false;
    size_t segment_count = 0;
    double recording_duration = 0.0;
    std::string app;

    // "complete", "partial" or "failed"
    const char* label() const;
};

// One recording cycle at a time: start workers, stop them, wait for their
// transcripts, merge, summarize.
//
// start_recording() and begin_stop() run on the caller's thread. The blocking
// tail, finish_cycle(), may run on another thread; while it does the state is
// outside Idle/Complete/Failed and every start attempt is refused, so only one
// thread ever drives transitions.
class SessionController {
public:
    struct Timing {
        std::chrono::milliseconds settle{2000};
        std::chrono::milliseconds stop_timeout{180000};
        std::chrono::milliseconds artifact_wait{120000};
        std::chrono::milliseconds artifact_poll{2000};

        static Timing from_config(const Config::Timing& t);
    };

    // `summarizer` may be null: summaries are then reported unavailable.
    SessionController(ProcessLauncher& launcher, Indicator& indicator, Summarizer* summarizer,
                      std::vector<LaunchSpec> workers, ArtifactSet artifacts, Timing timing,
                      bool verbose = false);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void on_presence(const PresenceEvent& event);

    // Idle/Complete/Failed -> Recording. On failure the session is Idle.
    std::expected<void, SessionError> start_recording();

    // Recording -> Stopping. False (no change) in any other state.
    bool begin_stop();

    // Stopping -> WaitingArtifacts -> Merging -> Summarizing -> Complete,
    // or -> Failed. Blocks for up to the stop timeout per worker plus the
    // artifact wait ceiling plus the summary call.
    CycleOutcome finish_cycle();

    // begin_stop() + finish_cycle(); nullopt if not recording.
    std::optional<CycleOutcome> stop_recording();

    bool can_start() const;
    SessionState state() const { return state_.load(std::memory_order_acquire); }
    StatusLabel status() const { return status_.load(std::memory_order_acquire); }
    double recording_duration() const;
    std::string meeting_app() const;
    bool marker_visible() const;

    // Not synchronized with finish_cycle(); for callers that own the thread.
    const WorkerSupervisor& supervisor() const { return supervisor_; }

private:
    void transition(SessionState next, StatusLabel label, const std::string& detail = "");
    void report(StatusLabel label, const std::string& detail);
    std::optional<SessionError> wait_for_artifacts();
    CycleOutcome fail(CycleOutcome outcome, SessionError err);
    void log(const std::string& msg);

    Indicator& indicator_;
    Summarizer* summarizer_;
    ArtifactSet artifacts_;
    Timing timing_;
    bool verbose_;

    WorkerSupervisor supervisor_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<StatusLabel> status_{StatusLabel::Idle};

    mutable std::mutex mutex_; // guards everything below and indicator calls
    std::string meeting_app_;
    bool marker_visible_ = false;
    std::string cycle_app_;
    std::chrono::steady_clock::time_point record_start_;
    std::chrono::steady_clock::time_point record_stop_;
};
