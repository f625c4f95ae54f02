#pragma once

#include <chrono>

namespace core {

// ---------------------------------------------------------------------------
// Process-wide shutdown flag
// ---------------------------------------------------------------------------

/// SIGINT, SIGTERM and SIGHUP request a graceful shutdown; a second one
/// exits at once. SIGPIPE is ignored so a peer that hangs up mid-request
/// shows up as a write error. Safe to call more than once.
void init_signal_handlers();

[[nodiscard]] bool shutdown_requested() noexcept;

/// Set the flag and wake every waiter.
void request_shutdown();

void wait_for_shutdown();

/// Sleep for @p duration unless a shutdown comes first. Returns false when
/// cut short. A shutdown raised from a signal handler is noticed within
/// SIGNAL_POLL_INTERVAL.
bool sleep_unless_shutdown(std::chrono::milliseconds duration);

inline constexpr std::chrono::milliseconds SIGNAL_POLL_INTERVAL{100};

/// Clear the flag. For tests.
void reset_shutdown();

} // namespace core
