#include "transcript/timestamp.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <vector>

namespace timestamp {

namespace {

bool to_int(std::string_view s, long long& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// from_chars also takes "inf" and "nan"; those are not seconds.
bool to_double(std::string_view s, double& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && std::isfinite(out);
}

// Beyond this llround() has no int64 result.
constexpr double kMaxRenderable = 9.0e16;

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

double parse(std::string_view ts) {
    auto colons = std::ranges::count(ts, ':');
    if (colons != 1 && colons != 2) return 0.0;

    auto parts = split(ts, ':');
    long long h = 0;
    long long m = 0;
    double s = 0.0;

    if (colons == 2) {
        if (!to_int(parts[0], h) || !to_int(parts[1], m) || !to_double(parts[2], s)) return 0.0;
    } else {
        if (!to_int(parts[0], m) || !to_double(parts[1], s)) return 0.0;
    }

    double total = static_cast<double>(h) * 3600.0 + static_cast<double>(m) * 60.0 + s;
    if (!std::isfinite(total) || total < 0.0) return 0.0;
    return total;
}

std::string render(double seconds) {
    if (!(seconds > 0.0) || !(seconds < kMaxRenderable)) seconds = 0.0;

    // Work in hundredths so 59.999 carries into the next minute instead of
    // printing "00:60.00".
    auto hundredths = static_cast<int64_t>(std::llround(seconds * 100.0));
    int64_t minutes = hundredths / 6000;
    int64_t rem = hundredths % 6000;
    return std::format("{:02}:{:02}.{:02}", minutes, rem / 100, rem % 100);
}

} // namespace timestamp
