#include "core/time.h"

#include <array>
#include <ctime>

namespace core {

int64_t get_time() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_iso8601(int64_t unix_seconds) {
    const auto tt = static_cast<std::time_t>(unix_seconds);
    std::tm utc{};
    if (gmtime_r(&tt, &utc) == nullptr) return {};

    std::array<char, 32> buf{};
    const size_t n = std::strftime(buf.data(), buf.size(),
                                   "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data(), n);
}

int64_t StopWatch::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - start_).count();
}

std::chrono::milliseconds Deadline::remaining() const {
    const auto left = at_ - SteadyClock::now();
    if (left <= SteadyClock::duration::zero()) return std::chrono::milliseconds(0);
    // Round up so a positive remainder never reads as zero.
    return std::chrono::ceil<std::chrono::milliseconds>(left);
}

} // namespace core
