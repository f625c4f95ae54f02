// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "publish/fee_ledger.h"

#include "core/fs.h"
#include "core/logging.h"

#include <map>
#include <memory>

namespace publish {

namespace {

std::mutex& mutex_for(const std::filesystem::path& path) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> registry;

    std::error_code ec;
    std::filesystem::path key = std::filesystem::absolute(path, ec);
    if (ec) key = path;
    key = key.lexically_normal();

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& slot = registry[key.string()];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Text format
// ---------------------------------------------------------------------------

FeeLedgerSnapshot parse_fee_ledger(std::string_view content) {
    FeeLedgerSnapshot snap;
    if (content.empty()) return snap;

    size_t eol = content.find('\n');
    std::string_view header = content.substr(0, eol);
    if (header.substr(0, LEDGER_TOTAL_PREFIX.size()) != LEDGER_TOTAL_PREFIX) {
        snap.header_missing = true;
        return snap;
    }

    auto total = FeeAmount::parse(header.substr(LEDGER_TOTAL_PREFIX.size()));
    if (total) {
        snap.total = *total;
    } else {
        snap.total_unparsable = true;
    }

    std::string_view rest = (eol == std::string_view::npos)
                                ? std::string_view{}
                                : content.substr(eol + 1);
    while (!rest.empty()) {
        eol = rest.find('\n');
        std::string_view line = trim(rest.substr(0, eol));
        rest = (eol == std::string_view::npos) ? std::string_view{}
                                               : rest.substr(eol + 1);
        if (line.empty()) continue;
        if (auto entry = FeeAmount::parse(line)) {
            snap.entries.push_back(*entry);
        } else {
            ++snap.dropped_lines;
        }
    }
    return snap;
}

std::string format_fee_ledger(const FeeLedgerSnapshot& snapshot) {
    std::string out;
    out.reserve(32 + snapshot.entries.size() * 16);
    out += LEDGER_TOTAL_PREFIX;
    out += ' ';
    out += snapshot.total.to_string();
    out += '\n';
    for (const auto& entry : snapshot.entries) {
        out += entry.to_string();
        out += '\n';
    }
    return out;
}

// ---------------------------------------------------------------------------
// FeeLedger
// ---------------------------------------------------------------------------

FeeLedger::FeeLedger(std::filesystem::path path)
    : path_(std::move(path)), process_mutex_(&mutex_for(path_)) {}

std::filesystem::path FeeLedger::lock_path() const {
    std::filesystem::path p = path_;
    p += ".lock";
    return p;
}

core::Result<FeeLedgerSnapshot> FeeLedger::load_locked() const {
    auto content = core::fs::read_file(path_);
    if (!content) {
        std::error_code ec;
        if (std::filesystem::exists(path_, ec)) {
            return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                    "cannot read fee ledger " + path_.string());
        }
        return FeeLedgerSnapshot{};
    }
    return parse_fee_ledger(*content);
}

core::Result<FeeLedgerSnapshot> FeeLedger::read() const {
    std::lock_guard<std::mutex> guard(*process_mutex_);
    if (path_.has_parent_path() && !core::fs::ensure_directory(path_.parent_path())) {
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
            "cannot create directory for " + path_.string());
    }
    core::fs::FileLock file_lock(lock_path());
    CHAINBOARD_TRY_VOID(file_lock.lock());
    core::fs::ScopedFileLock scoped(file_lock);
    return load_locked();
}

core::Result<FeeAmount> FeeLedger::record(FeeAmount fee) {
    std::lock_guard<std::mutex> guard(*process_mutex_);
    if (path_.has_parent_path() && !core::fs::ensure_directory(path_.parent_path())) {
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
            "cannot create directory for " + path_.string());
    }
    core::fs::FileLock file_lock(lock_path());
    CHAINBOARD_TRY_VOID(file_lock.lock());
    core::fs::ScopedFileLock scoped(file_lock);
    LOG_TRACE(core::LogCategory::LOCK, "acquired " + lock_path().string());

    CHAINBOARD_TRY_ASSIGN(snap, load_locked());
    if (snap.header_missing) {
        LOG_WARN(core::LogCategory::FEES,
                 path_.string() + ": first line is not a TOTAL header; "
                 "starting from 0 and discarding previous entries");
    } else if (snap.total_unparsable) {
        LOG_WARN(core::LogCategory::FEES,
                 path_.string() + ": unparsable TOTAL header; "
                 "starting from 0");
    }
    if (snap.dropped_lines > 0) {
        LOG_WARN(core::LogCategory::FEES,
                 path_.string() + ": dropped " +
                 std::to_string(snap.dropped_lines) + " malformed entries");
    }

    CHAINBOARD_TRY_ASSIGN(new_total, snap.total + fee);
    snap.total = new_total;
    snap.entries.push_back(fee);

    CHAINBOARD_TRY_VOID(core::fs::write_file(path_, format_fee_ledger(snap)));

    LOG_INFO(core::LogCategory::FEES,
             "recorded fee " + fee.to_string() + " ETH, total " +
             new_total.to_string() + " ETH");
    return new_total;
}

} // namespace publish
