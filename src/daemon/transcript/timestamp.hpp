#pragma once

#include <string>
#include <string_view>

// Timestamp dialects written by the capture workers:
//   HH:MM:SS.fff  (mic worker)
//   MM:SS.ff      (speaker worker)
// Canonical output is always MM:SS.ff with unbounded minutes.
namespace timestamp {

// Number of ':' separators decides the dialect. Any other shape, and any
// non-finite result, yields 0.0.
double parse(std::string_view ts);

// Negative, non-finite and unrepresentably large values render as zero.
std::string render(double seconds);

// render(parse(ts)).
inline std::string to_canonical(std::string_view ts) {
    return render(parse(ts));
}

} // namespace timestamp
