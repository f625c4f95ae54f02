// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "app/app.h"
#include "app/logging_init.h"

#include "core/logging.h"
#include "core/signal.h"
#include "core/time.h"
#include "eth/endpoint.h"
#include "publish/fee_ledger.h"
#include "publish/gas_price.h"

#include <stdexcept>
#include <utility>

namespace app {

App::App(AppConfig config) : config_(std::move(config)) {}

App::~App() {
    shutdown();
}

publish::PublishWorker& App::worker(size_t index) {
    if (index >= boards_.size()) {
        throw std::out_of_range("App::worker: no board at index " +
                                std::to_string(index));
    }
    return *boards_[index].worker;
}

// ---------------------------------------------------------------------------
// build_board
// ---------------------------------------------------------------------------

core::Result<App::Board> App::build_board(const BoardConfig& board) const {
    Board out;

    auto key = crypto::ECKey::from_hex(board.private_key_hex);
    if (!key.ok()) {
        // The key text itself never reaches the log.
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "invalid private key for board " + board.id);
    }
    out.key = std::make_unique<crypto::ECKey>(std::move(key).value());

    eth::EndpointTimeouts timeouts;
    timeouts.probe = config_.probe_timeout;
    timeouts.request = config_.request_timeout;
    timeouts.receipt = config_.receipt_timeout;
    timeouts.receipt_poll = config_.receipt_poll;

    std::vector<std::unique_ptr<publish::Endpoint>> endpoints;
    endpoints.reserve(config_.rpc_urls.size());
    for (const auto& url : config_.rpc_urls) {
        endpoints.push_back(std::make_unique<eth::EthEndpoint>(
            url, *out.key, config_.contract, timeouts));
    }

    CHAINBOARD_TRY_ASSIGN(gas, publish::GasPriceController::create(config_.gas));

    publish::WorkerOptions options;
    options.board_id = board.id;
    options.source_path = board.source_path;
    options.template_path = config_.template_path;
    options.state_path = board.state_path;
    options.token_id = board.token_id;
    options.write_key = config_.write_key;
    options.gas_limit = config_.gas_limit;
    options.poll_interval = config_.poll_interval;

    out.worker = std::make_unique<publish::PublishWorker>(
        std::move(options), std::move(endpoints), std::move(gas),
        publish::FeeLedger(config_.fee_file));
    out.worker->init();

    LOG_INFO(core::LogCategory::PUBLISH,
             "board " + board.id + " signs as " +
             eth::Address::from_pubkey(out.key->pubkey_uncompressed())
                 .to_checksum_hex());
    return out;
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

core::Result<void> App::init() {
    if (initialized_) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                "already initialized");
    }
    core::StopWatch sw;

    core::init_signal_handlers();
    CHAINBOARD_TRY_VOID(init_logging(config_));

    std::vector<Board> boards;
    for (const auto& board : config_.boards) {
        CHAINBOARD_TRY_ASSIGN(built, build_board(board));
        boards.push_back(std::move(built));
    }
    boards_ = std::move(boards);

    auto ledger = publish::FeeLedger(config_.fee_file).read();
    if (ledger.ok()) {
        LOG_INFO(core::LogCategory::FEES,
                 "fee ledger " + config_.fee_file.string() + ": total " +
                 ledger.value().total.to_string() + " ETH over " +
                 std::to_string(ledger.value().entries.size()) + " entries");
    } else {
        LOG_WARN(core::LogCategory::FEES,
                 "cannot read fee ledger: " + ledger.error().format());
    }

    initialized_ = true;
    LOG_INFO(core::LogCategory::NONE,
             "initialized " + std::to_string(boards_.size()) +
             " board(s) in " + std::to_string(sw.elapsed_ms()) + " ms");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

void App::run() {
    if (!initialized_ || running_.exchange(true)) return;

    for (auto& board : boards_) {
        publish::PublishWorker* worker = board.worker.get();
        threads_.create_thread("board" + worker->options().board_id,
                               [worker] { worker->run(); });
    }

    core::wait_for_shutdown();
    LOG_INFO(core::LogCategory::NONE,
             "shutdown requested, waiting for workers");
    threads_.join_all();
    running_ = false;
}

// ---------------------------------------------------------------------------
// shutdown
// ---------------------------------------------------------------------------

void App::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    core::request_shutdown();
    threads_.join_all();
    running_ = false;

    for (const auto& board : boards_) {
        LOG_INFO(core::LogCategory::PUBLISH,
                 "board " + board.worker->options().board_id + ": " +
                 std::to_string(board.worker->cycles()) + " cycle(s)");
    }
    boards_.clear();

    LOG_INFO(core::LogCategory::NONE, get_client_name() + " stopped");
    core::Logger::instance().flush();
}

} // namespace app
