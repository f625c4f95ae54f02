#include "publish/source.h"

#include "core/fs.h"

namespace publish {

namespace {

std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c != '\n' && c != '\r') continue;
        lines.emplace_back(content.substr(start, i - start));
        if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') ++i;
        start = i + 1;
    }
    if (start < content.size()) {
        lines.emplace_back(content.substr(start));
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

SourceRecord parse_source(std::string_view content) {
    SourceRecord rec;
    std::vector<std::string> lines = split_lines(content);
    if (lines.empty()) {
        rec.state = SourceRecord::State::EMPTY;
        return rec;
    }

    std::string_view last = lines.back();
    if (last.substr(0, CLOCK_PREFIX.size()) != CLOCK_PREFIX) {
        rec.state = SourceRecord::State::MALFORMED;
        return rec;
    }
    std::string_view token = trim(last.substr(CLOCK_PREFIX.size()));
    if (token.empty()) {
        rec.state = SourceRecord::State::MALFORMED;
        return rec;
    }

    rec.state = SourceRecord::State::READY;
    rec.clock = std::string(token);
    lines.pop_back();
    rec.lines = std::move(lines);
    return rec;
}

SourceRecord read_source(const std::filesystem::path& path) {
    auto content = core::fs::read_file(path);
    if (!content) return SourceRecord{};
    return parse_source(*content);
}

} // namespace publish
