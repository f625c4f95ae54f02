#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBOARD_PUBLISH_WORKER_H
#define CHAINBOARD_PUBLISH_WORKER_H

#include "core/types.h"
#include "publish/document.h"
#include "publish/endpoint.h"
#include "publish/fee_ledger.h"
#include "publish/gas_price.h"
#include "publish/state.h"
#include "publish/submitter.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace publish {

enum class CycleOutcome {
    WAITING_FOR_SOURCE,
    MALFORMED_SOURCE,
    UNCHANGED,
    RENDER_FAILED,
    PUBLISHED,
    PUBLISH_FAILED,
    CYCLE_ERROR,
};

[[nodiscard]] std::string_view cycle_outcome_name(CycleOutcome outcome) noexcept;

struct WorkerOptions {
    std::string           board_id;
    std::filesystem::path source_path;
    std::filesystem::path template_path;
    std::filesystem::path state_path;       // empty: in-memory only
    core::Bytes32         token_id;
    core::Bytes32         write_key;
    uint64_t              gas_limit = 29'504'000;
    std::chrono::milliseconds poll_interval{60'000};
};

// ---------------------------------------------------------------------------
// PublishWorker -- the per-board change detector and publish loop
// ---------------------------------------------------------------------------
// Owns everything that is per board: endpoints, gas price state, publish
// state and the submitter wired to them. Only the fee ledger file is
// shared with other workers.
// ---------------------------------------------------------------------------
class PublishWorker {
public:
    PublishWorker(WorkerOptions options,
                  std::vector<std::unique_ptr<Endpoint>> endpoints,
                  GasPriceController gas,
                  FeeLedger ledger);

    PublishWorker(const PublishWorker&) = delete;
    PublishWorker& operator=(const PublishWorker&) = delete;

    /// Load the persisted publish state. A failure is logged and the
    /// worker starts as if nothing had been published.
    void init();

    /// One poll: read source, gate on the clock, render, publish. Never
    /// throws.
    CycleOutcome run_cycle();

    /// Run cycles every poll interval until shutdown is requested.
    void run();

    [[nodiscard]] const WorkerOptions& options() const { return options_; }
    [[nodiscard]] const GasPriceController& gas() const { return gas_; }
    [[nodiscard]] const PublishState& state() const { return state_; }
    [[nodiscard]] uint64_t cycles() const { return cycles_; }

private:
    CycleOutcome run_cycle_unguarded();

    WorkerOptions                          options_;
    std::vector<std::unique_ptr<Endpoint>> endpoints_;
    GasPriceController                     gas_;
    FeeLedger                              ledger_;
    DocumentRenderer                       renderer_;
    PublishState                           state_;
    TransactionSubmitter                   submitter_;
    uint64_t                               cycles_ = 0;
};

} // namespace publish

#endif // CHAINBOARD_PUBLISH_WORKER_H
