#include "publish/state.h"

#include "core/fs.h"

#include <string_view>

namespace publish {

namespace {

constexpr std::string_view CLOCK_KEY = "last_published_clock=";

} // anonymous namespace

core::Result<void> PublishState::load() {
    if (!persistent()) return core::make_ok();

    auto content = core::fs::read_file(state_file_);
    if (!content) {
        if (core::fs::file_exists(state_file_)) {
            return core::make_error(core::ErrorCode::STORAGE_ERROR,
                "cannot read state file " + state_file_.string());
        }
        return core::make_ok();
    }

    std::string_view text = *content;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (text.substr(0, CLOCK_KEY.size()) != CLOCK_KEY ||
        text.find('\n') != std::string_view::npos) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
            "unrecognised state file " + state_file_.string());
    }
    text.remove_prefix(CLOCK_KEY.size());
    if (!text.empty()) last_clock_ = std::string(text);
    return core::make_ok();
}

core::Result<void> PublishState::commit(const std::string& clock) {
    last_clock_ = clock;
    if (!persistent()) return core::make_ok();
    return core::fs::write_file(state_file_,
                                std::string(CLOCK_KEY) + clock + "\n");
}

} // namespace publish
