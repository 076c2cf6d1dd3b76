#pragma once

#include <string>
#include <vector>

enum class ErrorKind {
    WorkerStartFailed,  // a capture worker exited during the settle window
    MissingInputs,      // transcript artifacts absent or vanished before merge
    FileUnreadable,     // an artifact exists but could not be read or written
    SummaryUnavailable, // summarization failed; cycle completes as partial
    SessionBusy,        // start refused outside Idle/Complete/Failed; not a cycle failure
};

struct SessionError {
    ErrorKind kind;
    std::string message;

    // WorkerStartFailed
    std::string worker;
    int exit_code = 0;

    // MissingInputs
    std::vector<std::string> paths;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::WorkerStartFailed: return "worker_start_failed";
        case ErrorKind::MissingInputs: return "missing_inputs";
        case ErrorKind::FileUnreadable: return "file_unreadable";
        case ErrorKind::SummaryUnavailable: return "summary_unavailable";
        case ErrorKind::SessionBusy: return "session_busy";
    }
    return "unknown";
}

inline SessionError missing_inputs_error(std::vector<std::string> paths) {
    std::string msg = "missing files:";
    for (const auto& p : paths) msg += " " + p;
    return SessionError{
        .kind = ErrorKind::MissingInputs,
        .message = std::move(msg),
        .paths = std::move(paths),
    };
}
