// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "publish/worker.h"

#include "core/logging.h"
#include "core/signal.h"
#include "publish/source.h"

#include <exception>

namespace publish {

std::string_view cycle_outcome_name(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::WAITING_FOR_SOURCE: return "WAITING_FOR_SOURCE";
        case CycleOutcome::MALFORMED_SOURCE:   return "MALFORMED_SOURCE";
        case CycleOutcome::UNCHANGED:          return "UNCHANGED";
        case CycleOutcome::RENDER_FAILED:      return "RENDER_FAILED";
        case CycleOutcome::PUBLISHED:          return "PUBLISHED";
        case CycleOutcome::PUBLISH_FAILED:     return "PUBLISH_FAILED";
        case CycleOutcome::CYCLE_ERROR:        return "CYCLE_ERROR";
    }
    return "UNKNOWN";
}

PublishWorker::PublishWorker(WorkerOptions options,
                             std::vector<std::unique_ptr<Endpoint>> endpoints,
                             GasPriceController gas,
                             FeeLedger ledger)
    : options_(std::move(options)),
      endpoints_(std::move(endpoints)),
      gas_(std::move(gas)),
      ledger_(std::move(ledger)),
      renderer_(options_.template_path),
      state_(options_.state_path),
      submitter_(endpoints_, gas_, ledger_, options_.token_id,
                 options_.write_key, options_.gas_limit) {}

void PublishWorker::init() {
    auto loaded = state_.load();
    if (!loaded.ok()) {
        LOG_ERROR(core::LogCategory::PUBLISH,
                  "board " + options_.board_id + ": " +
                  loaded.error().message() + "; assuming nothing published");
        return;
    }
    if (state_.last_published_clock()) {
        LOG_INFO(core::LogCategory::PUBLISH,
                 "board " + options_.board_id + ": last published clock " +
                 *state_.last_published_clock());
    }
}

CycleOutcome PublishWorker::run_cycle() {
    ++cycles_;
    try {
        return run_cycle_unguarded();
    } catch (const std::exception& e) {
        LOG_ERROR(core::LogCategory::PUBLISH,
                  "board " + options_.board_id + ": error in cycle: " + e.what());
        return CycleOutcome::CYCLE_ERROR;
    }
}

CycleOutcome PublishWorker::run_cycle_unguarded() {
    const std::string& board = options_.board_id;
    const SourceRecord rec = read_source(options_.source_path);

    switch (rec.state) {
        case SourceRecord::State::MISSING:
            LOG_INFO(core::LogCategory::SOURCE,
                     "board file " + options_.source_path.string() +
                     " not found, waiting for it to be created");
            return CycleOutcome::WAITING_FOR_SOURCE;
        case SourceRecord::State::EMPTY:
            LOG_INFO(core::LogCategory::SOURCE,
                     "board file " + options_.source_path.string() +
                     " is empty, waiting");
            return CycleOutcome::WAITING_FOR_SOURCE;
        case SourceRecord::State::MALFORMED:
            LOG_WARN(core::LogCategory::SOURCE,
                     "board file " + options_.source_path.string() +
                     " has no trailing Timestamp line, waiting");
            return CycleOutcome::MALFORMED_SOURCE;
        case SourceRecord::State::READY:
            break;
    }

    if (state_.last_published_clock() == rec.clock) {
        LOG_DEBUG(core::LogCategory::SOURCE,
                  "no new update for board " + board);
        return CycleOutcome::UNCHANGED;
    }

    LOG_INFO(core::LogCategory::SOURCE,
             "[" + rec.clock + "] detected update for board " + board +
             " (" + std::to_string(rec.lines.size()) + " lines)");

    auto document = renderer_.render(board, rec.lines, rec.clock);
    if (!document.ok()) {
        LOG_ERROR(core::LogCategory::PUBLISH,
                  "board " + board + ": rendering failed: " +
                  document.error().message());
        return CycleOutcome::RENDER_FAILED;
    }

    auto published = submitter_.publish(document.value());
    if (!published.ok()) {
        LOG_WARN(core::LogCategory::PUBLISH,
                 "board " + board + ": " + published.error().message() +
                 "; will retry next cycle");
        return CycleOutcome::PUBLISH_FAILED;
    }

    auto committed = state_.commit(rec.clock);
    if (!committed.ok()) {
        LOG_ERROR(core::LogCategory::PUBLISH,
                  "board " + board + ": could not persist publish state: " +
                  committed.error().message());
    }
    LOG_INFO(core::LogCategory::PUBLISH,
             "board " + board + " updated on-chain at clock " + rec.clock);
    return CycleOutcome::PUBLISHED;
}

void PublishWorker::run() {
    LOG_INFO(core::LogCategory::PUBLISH,
             "starting worker for board " + options_.board_id + " (" +
             std::to_string(endpoints_.size()) + " endpoints, source " +
             options_.source_path.string() + ")");

    while (!core::shutdown_requested()) {
        CycleOutcome outcome = run_cycle();
        LOG_TRACE(core::LogCategory::PUBLISH,
                  "board " + options_.board_id + " cycle " +
                  std::to_string(cycles_) + ": " +
                  std::string(cycle_outcome_name(outcome)));
        if (!core::sleep_unless_shutdown(options_.poll_interval)) break;
    }

    LOG_INFO(core::LogCategory::PUBLISH,
             "worker for board " + options_.board_id + " stopped");
}

} // namespace publish
