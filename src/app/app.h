#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// App -- top-level orchestrator for the chainboard process.
//
//   1. Construction:  stores the AppConfig.
//   2. init():        signal handlers, logging, then one PublishWorker per
//                     board (own key, endpoints, gas controller, state),
//                     all sharing the fee ledger file.
//   3. run():         one thread per worker; blocks until shutdown is
//                     requested and every worker has returned.
//   4. shutdown():    joins leftover threads and flushes the log.
// ---------------------------------------------------------------------------

#ifndef CHAINBOARD_APP_APP_H
#define CHAINBOARD_APP_APP_H

#include "app/config.h"
#include "core/error.h"
#include "core/thread.h"
#include "crypto/secp256k1.h"
#include "publish/worker.h"

#include <atomic>
#include <memory>
#include <vector>

namespace app {

class App {
public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Wire up every board. Nothing is started on failure.
    [[nodiscard]] core::Result<void> init();

    /// Run all workers until a shutdown is requested.
    void run();

    /// Safe to call more than once.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] const AppConfig& config() const noexcept { return config_; }
    [[nodiscard]] size_t worker_count() const noexcept { return boards_.size(); }

    /// Worker for the i-th configured board. Valid after init().
    [[nodiscard]] publish::PublishWorker& worker(size_t index);

private:
    /// The key is referenced by the board's endpoints, so it is declared
    /// (and destroyed) around the worker.
    struct Board {
        std::unique_ptr<crypto::ECKey>          key;
        std::unique_ptr<publish::PublishWorker> worker;
    };

    core::Result<Board> build_board(const BoardConfig& board) const;

    AppConfig          config_;
    std::vector<Board> boards_;
    core::ThreadGroup  threads_;
    std::atomic<bool>  running_{false};
    bool               initialized_ = false;
};

} // namespace app

#endif // CHAINBOARD_APP_APP_H
