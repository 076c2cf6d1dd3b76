#include "platform/indicator.hpp"

const char* status_name(StatusLabel label) {
    switch (label) {
        case StatusLabel::Idle: return "idle";
        case StatusLabel::MeetingDetected: return "meeting_detected";
        case StatusLabel::NoMeeting: return "no_meeting";
        case StatusLabel::Recording: return "recording";
        case StatusLabel::Stopping: return "stopping";
        case StatusLabel::Processing: return "processing";
        case StatusLabel::Merging: return "merging";
        case StatusLabel::Summarizing: return "summarizing";
        case StatusLabel::Complete: return "complete";
        case StatusLabel::Partial: return "partial";
        case StatusLabel::Failed: return "failed";
    }
    return "unknown";
}

const char* status_color(StatusLabel label) {
    switch (label) {
        case StatusLabel::Recording:
        case StatusLabel::Complete:
            return "#00C851";
        case StatusLabel::Stopping:
            return "#ff4444";
        case StatusLabel::MeetingDetected:
        case StatusLabel::Processing:
        case StatusLabel::Merging:
        case StatusLabel::Summarizing:
            return "blue";
        case StatusLabel::Partial:
            return "orange";
        case StatusLabel::Idle:
        case StatusLabel::NoMeeting:
        case StatusLabel::Failed:
            return "gray";
    }
    return "gray";
}
