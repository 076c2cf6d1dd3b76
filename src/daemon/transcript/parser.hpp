#pragma once

#include "transcript/segment.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transcript {

// Parses one line in either timestamp dialect. Returns nullopt for lines
// matching neither (headers, blank lines, free text).
std::optional<Segment> parse_line(std::string_view line, SourceLabel label);

// Reads a worker's transcript file. Fails only if the file cannot be opened;
// unmatched lines are skipped. File order is preserved.
std::expected<std::vector<Segment>, std::string>
    parse_file(const std::string& path, SourceLabel label);

} // namespace transcript
