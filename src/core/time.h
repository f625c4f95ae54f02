#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace core {

using SteadyClock = std::chrono::steady_clock;

/// Wall-clock seconds since the Unix epoch.
int64_t get_time();

/// "1970-01-01T00:00:00Z" form, always UTC.
std::string format_iso8601(int64_t unix_seconds);

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

class StopWatch {
public:
    StopWatch() : start_(SteadyClock::now()) {}

    [[nodiscard]] int64_t elapsed_ms() const;
    void reset() { start_ = SteadyClock::now(); }

private:
    SteadyClock::time_point start_;
};

// ---------------------------------------------------------------------------
// Deadline
// ---------------------------------------------------------------------------

/// A fixed point on the monotonic clock shared by several waits, e.g. the
/// connect, write and read phases of one HTTP exchange or the polls of a
/// receipt wait.
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds budget)
        : budget_(budget), at_(SteadyClock::now() + budget) {}

    [[nodiscard]] bool expired() const { return SteadyClock::now() >= at_; }

    /// Time left, zero once expired.
    [[nodiscard]] std::chrono::milliseconds remaining() const;

    [[nodiscard]] std::chrono::milliseconds budget() const { return budget_; }

private:
    std::chrono::milliseconds budget_;
    SteadyClock::time_point   at_;
};

} // namespace core
