#pragma once

#include <string>

enum class StatusLabel {
    Idle,
    MeetingDetected,
    NoMeeting,
    Recording,
    Stopping,
    Processing,
    Merging,
    Summarizing,
    Complete,
    Partial,
    Failed,
};

const char* status_name(StatusLabel label);

// Ring color the on-screen marker shows for a status.
const char* status_color(StatusLabel label);

// On-screen status marker. Presentation only; the session never reads it back.
class Indicator {
public:
    virtual ~Indicator() = default;
    virtual void show() = 0;
    virtual void hide() = 0;
    virtual void set_color(const std::string& color) = 0;
    virtual void set_status(StatusLabel label, const std::string& detail) = 0;
};
