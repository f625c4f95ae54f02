#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBOARD_PUBLISH_FEE_LEDGER_H
#define CHAINBOARD_PUBLISH_FEE_LEDGER_H

#include "core/error.h"
#include "publish/fee_amount.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace publish {

inline constexpr std::string_view LEDGER_TOTAL_PREFIX = "TOTAL:";

struct FeeLedgerSnapshot {
    FeeAmount total;
    std::vector<FeeAmount> entries;    // oldest first

    // Diagnostics from parsing; not written back.
    bool   header_missing = false;     // first line lacked "TOTAL:"
    bool   total_unparsable = false;   // "TOTAL:" followed by garbage
    size_t dropped_lines = 0;          // entry lines that were not decimals
};

/// Parse ledger text. Missing or empty content is an empty ledger. A first
/// line without the "TOTAL:" prefix yields total 0 and discards every
/// other line; an unparsable total yields 0 but keeps parseable entries.
FeeLedgerSnapshot parse_fee_ledger(std::string_view content);

/// "TOTAL: <total>\n" then one entry per line, all with ten decimals.
std::string format_fee_ledger(const FeeLedgerSnapshot& snapshot);

// ---------------------------------------------------------------------------
// FeeLedger -- durable running total of fees paid
// ---------------------------------------------------------------------------
// Every read-modify-write holds, in this order:
//   1. a process-wide mutex keyed by the ledger's absolute path,
//   2. an exclusive flock on "<ledger>.lock".
// The ledger itself is replaced with write-to-temp + rename, so readers
// and crashes only ever see a complete file. Instances are cheap; any
// number of them may refer to the same path.
// ---------------------------------------------------------------------------
class FeeLedger {
public:
    explicit FeeLedger(std::filesystem::path path);

    /// Add @p fee to the total and append it as the newest entry.
    /// Returns the new total.
    core::Result<FeeAmount> record(FeeAmount fee);

    /// Current contents, read under the same locks as record().
    core::Result<FeeLedgerSnapshot> read() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path lock_path() const;

private:
    core::Result<FeeLedgerSnapshot> load_locked() const;

    std::filesystem::path path_;
    std::mutex* process_mutex_;    // owned by the registry, never freed
};

} // namespace publish

#endif // CHAINBOARD_PUBLISH_FEE_LEDGER_H
