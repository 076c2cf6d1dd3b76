#pragma once

#include "artifacts.hpp"
#include "session_error.hpp"
#include "transcript/segment.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace transcript {

// Orders by (start, end, label), then text, so identical multisets always
// produce the same sequence. The sort is stable.
void sort_segments(std::vector<Segment>& segments);

std::vector<Segment> merge_segments(std::vector<Segment> first, std::vector<Segment> second);

// "[MM:SS.ff → MM:SS.ff] (LABEL) text"
std::string format_segment(const Segment& seg);

// One formatted line per segment, each newline-terminated.
std::string render_transcript(const std::vector<Segment>& segments);

struct MergeResult {
    std::string combined_path;
    size_t segment_count = 0;
};

// Combines the mic and speaker artifacts into the combined transcript and
// removes the sources. All-or-nothing: sources are deleted only after the
// combined file is fully written and renamed into place.
class MergeEngine {
public:
    explicit MergeEngine(ArtifactSet artifacts);

    // Checks both inputs exist, then parses them into merged order.
    std::expected<std::vector<Segment>, SessionError> load() const;

    // Writes the combined file and deletes the sources. Inputs are re-checked
    // right before the combined file is committed.
    std::expected<MergeResult, SessionError> commit(const std::vector<Segment>& merged) const;

    // load() then commit().
    std::expected<MergeResult, SessionError> run() const;

    const ArtifactSet& artifacts() const { return artifacts_; }

private:
    ArtifactSet artifacts_;
};

} // namespace transcript
