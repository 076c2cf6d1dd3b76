#pragma once

#include <algorithm>
#include <chrono>
#include <thread>

// Evaluates `done` immediately and then every `interval` until it returns true
// or `ceiling` has elapsed. The last evaluation happens at the deadline.
// Returns whether `done` was satisfied.
template <typename Pred>
bool poll_until(std::chrono::milliseconds interval, std::chrono::milliseconds ceiling, Pred&& done) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + ceiling;

    while (true) {
        if (done()) return true;

        auto now = clock::now();
        if (now >= deadline) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::max(std::chrono::milliseconds(1), std::min(interval, remaining)));
    }
}
