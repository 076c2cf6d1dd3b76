#include "transcript/parser.hpp"
#include "transcript/timestamp.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <regex>

namespace transcript {

namespace {

// "→" is U+2192, matched here as its UTF-8 byte sequence. Only the header is
// matched; the segment text is the match suffix, since libstdc++'s regex
// executor recurses once per character consumed and long lines overflow the
// stack.
const std::regex& dialect_a() {
    static const std::regex re(
        R"(\[(\d{2}:\d{2}:\d{2}\.\d+)\s*)" "\xE2\x86\x92" R"(\s*(\d{2}:\d{2}:\d{2}\.\d+)\]\s*)");
    return re;
}

const std::regex& dialect_b() {
    static const std::regex re(
        R"(\[(\d{2}:\d{2}\.\d+)\s*)" "\xE2\x86\x92" R"(\s*(\d{2}:\d{2}\.\d+)\]\s*)");
    return re;
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<Segment> parse_line(std::string_view raw, SourceLabel label) {
    auto line = trim(raw);
    if (line.empty()) return std::nullopt;

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(line.begin(), line.end(), m, dialect_a()) &&
        !std::regex_search(line.begin(), line.end(), m, dialect_b())) {
        return std::nullopt;
    }

    Segment seg;
    seg.start = timestamp::parse(std::string_view(&*m[1].first, m[1].length()));
    seg.end = timestamp::parse(std::string_view(&*m[2].first, m[2].length()));
    if (seg.end < seg.start) seg.end = seg.start;
    seg.text = m.suffix().str();
    seg.label = label;
    return seg;
}

std::expected<std::vector<Segment>, std::string>
parse_file(const std::string& path, SourceLabel label) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }

    std::vector<Segment> segments;
    std::string line;
    while (std::getline(f, line)) {
        if (auto seg = parse_line(line, label)) {
            segments.push_back(std::move(*seg));
        }
    }
    return segments;
}

} // namespace transcript
