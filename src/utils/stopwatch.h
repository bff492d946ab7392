#pragma once

#include <chrono>
#include <cstdint>

namespace utils {

// Monotonic elapsed-time probe for build/filter/commit timings in logs.
class Stopwatch {
public:
    using Clock = std::chrono::steady_clock;

    Stopwatch() : start_(Clock::now()) {}

    void reset() { start_ = Clock::now(); }

    std::int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

private:
    Clock::time_point start_;
};

} // namespace utils
