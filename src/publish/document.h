#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace publish {

inline constexpr std::string_view BOARD_DATA_MARKER  = "<!--BOARD_DATA-->";
inline constexpr std::string_view BOARD_ID_MARKER    = "<!--BOARD_ID-->";
inline constexpr std::string_view UPDATE_TIME_MARKER = "<!--LAST_UPDATE_TIME-->";

/// JSON array literal of @p lines as embedded in the page script:
/// ", " separators, DEL and every non-ASCII character escaped as \uXXXX
/// (surrogate pairs above U+FFFF). Invalid UTF-8 becomes U+FFFD.
std::string encode_board_data(const std::vector<std::string>& lines);

/// Replace the first occurrence of each marker. Markers are located in
/// the template before any substitution, so inserted text is never
/// rescanned; absent markers are left absent.
std::string render_document(std::string_view tmpl,
                            const std::string& board_id,
                            const std::vector<std::string>& lines,
                            const std::string& clock);

/// Renders from a template file that is re-read on every call so edits
/// take effect on the next publish.
class DocumentRenderer {
public:
    explicit DocumentRenderer(std::filesystem::path template_path)
        : template_path_(std::move(template_path)) {}

    core::Result<std::string> render(const std::string& board_id,
                                     const std::vector<std::string>& lines,
                                     const std::string& clock) const;

    [[nodiscard]] const std::filesystem::path& template_path() const {
        return template_path_;
    }

private:
    std::filesystem::path template_path_;
};

} // namespace publish
