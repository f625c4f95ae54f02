#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace publish {

inline constexpr std::string_view CLOCK_PREFIX = "Timestamp:";

/// One read of a board file. Only READY records carry lines and a clock.
struct SourceRecord {
    enum class State {
        MISSING,     // file absent or unreadable
        EMPTY,       // no lines at all
        MALFORMED,   // last line is not "Timestamp: <token>"
        READY,
    };

    State state = State::MISSING;
    std::vector<std::string> lines;   // content lines, clock line removed
    std::string clock;

    [[nodiscard]] bool ready() const { return state == State::READY; }
};

/// Split @p content into lines (LF, CRLF or CR; a trailing terminator does
/// not produce an empty last line) and validate the trailing clock line.
SourceRecord parse_source(std::string_view content);

SourceRecord read_source(const std::filesystem::path& path);

} // namespace publish
