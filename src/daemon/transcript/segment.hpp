#pragma once

#include <string>
#include <string_view>

// Which capture worker produced a segment. Declaration order is the merge
// tie-break order.
enum class SourceLabel { Mic, Speaker };

inline std::string_view label_name(SourceLabel label) {
    switch (label) {
        case SourceLabel::Mic: return "MIC";
        case SourceLabel::Speaker: return "SPEAKER";
    }
    return "UNKNOWN";
}

struct Segment {
    double start = 0.0; // seconds
    double end = 0.0;   // seconds, >= start
    std::string text;
    SourceLabel label = SourceLabel::Mic;
};
