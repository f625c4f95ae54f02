#pragma once

#include "core/error.h"

#include <filesystem>
#include <optional>
#include <string>

namespace publish {

/// Clock of the last confirmed publish of one board. With a state file
/// it survives restarts; without one it lives only in memory.
class PublishState {
public:
    explicit PublishState(std::filesystem::path state_file = {})
        : state_file_(std::move(state_file)) {}

    /// Load from the state file. A missing file is not an error.
    core::Result<void> load();

    /// Record a confirmed publish. The in-memory value is always updated;
    /// the returned error only concerns persisting it.
    core::Result<void> commit(const std::string& clock);

    [[nodiscard]] const std::optional<std::string>& last_published_clock() const {
        return last_clock_;
    }
    [[nodiscard]] bool persistent() const { return !state_file_.empty(); }
    [[nodiscard]] const std::filesystem::path& state_file() const {
        return state_file_;
    }

private:
    std::filesystem::path state_file_;
    std::optional<std::string> last_clock_;
};

} // namespace publish
