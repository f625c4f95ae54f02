// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "publish/document.h"

#include "core/fs.h"
#include "rpc/request.h"

#include <algorithm>

namespace publish {

std::string encode_board_data(const std::vector<std::string>& lines) {
    std::string out = "[";
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) out += ", ";
        rpc::append_json_string(out, lines[i], rpc::JsonEscape::ASCII);
    }
    out += ']';
    return out;
}

std::string render_document(std::string_view tmpl,
                            const std::string& board_id,
                            const std::vector<std::string>& lines,
                            const std::string& clock) {
    struct Splice {
        size_t      pos;
        size_t      len;
        std::string text;
    };

    std::vector<Splice> splices;
    auto locate = [&](std::string_view marker, std::string text) {
        size_t pos = tmpl.find(marker);
        if (pos != std::string_view::npos) {
            splices.push_back({pos, marker.size(), std::move(text)});
        }
    };
    locate(BOARD_DATA_MARKER, encode_board_data(lines));
    locate(BOARD_ID_MARKER, board_id);
    locate(UPDATE_TIME_MARKER, clock);

    std::sort(splices.begin(), splices.end(),
              [](const Splice& a, const Splice& b) { return a.pos < b.pos; });

    std::string out;
    out.reserve(tmpl.size() + 256);
    size_t cursor = 0;
    for (const auto& sp : splices) {
        out.append(tmpl.substr(cursor, sp.pos - cursor));
        out += sp.text;
        cursor = sp.pos + sp.len;
    }
    out.append(tmpl.substr(cursor));
    return out;
}

core::Result<std::string> DocumentRenderer::render(
    const std::string& board_id,
    const std::vector<std::string>& lines,
    const std::string& clock) const {
    auto tmpl = core::fs::read_file(template_path_);
    if (!tmpl) {
        return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
            "cannot read template " + template_path_.string());
    }
    return render_document(*tmpl, board_id, lines, clock);
}

} // namespace publish
