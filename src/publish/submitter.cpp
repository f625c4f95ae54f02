// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "publish/submitter.h"

#include "core/logging.h"
#include "eth/units.h"

#include <limits>

namespace publish {

core::Result<FeeAmount> compute_fee(uint64_t gas_used, uint64_t gas_price) {
    if (gas_used != 0 &&
        gas_price > std::numeric_limits<uint64_t>::max() / gas_used) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
            "fee overflows: " + std::to_string(gas_used) + " gas at " +
            std::to_string(gas_price) + " wei");
    }
    return eth::wei_to_fee(gas_used * gas_price);
}

TransactionSubmitter::TransactionSubmitter(
    const std::vector<std::unique_ptr<Endpoint>>& endpoints,
    GasPriceController& gas,
    FeeLedger& ledger,
    core::Bytes32 token_id,
    core::Bytes32 key,
    uint64_t gas_limit)
    : endpoints_(endpoints),
      gas_(gas),
      ledger_(ledger),
      token_id_(token_id),
      key_(key),
      gas_limit_(gas_limit) {}

core::Result<PublishReceipt> TransactionSubmitter::publish(
    const std::string& document) {
    size_t skipped = 0;
    size_t rejected = 0;
    size_t failed = 0;

    for (const auto& endpoint : endpoints_) {
        const std::string name = endpoint->name();

        if (!endpoint->is_reachable()) {
            LOG_WARN(core::LogCategory::PUBLISH,
                     "endpoint " + name + " not reachable, skipping");
            ++skipped;
            continue;
        }

        WriteRequest request;
        request.token_id  = token_id_;
        request.key       = key_;
        request.document  = document;
        request.gas_price = gas_.current();
        request.gas_limit = gas_limit_;

        auto outcome = endpoint->submit(request);

        if (!outcome.ok()) {
            ++failed;
            const core::Error& err = outcome.error();
            if (err.code() == core::ErrorCode::NETWORK_TIMEOUT) {
                LOG_WARN(core::LogCategory::PUBLISH,
                         "timeout via " + name + " at " +
                         eth::format_gwei(request.gas_price) + " gwei: " +
                         err.message());
            } else {
                LOG_WARN(core::LogCategory::PUBLISH,
                         "submission via " + name + " failed: " + err.format());
            }
            if (gas_.escalate() == GasPriceController::Escalation::RAISED) {
                LOG_INFO(core::LogCategory::GAS,
                         "gas price raised to " + eth::format_gwei(gas_.current()) +
                         " gwei");
            } else {
                LOG_WARN(core::LogCategory::GAS,
                         "gas price already at maximum " +
                         eth::format_gwei(gas_.current()) + " gwei");
            }
            continue;
        }

        const SubmitOutcome& result = outcome.value();
        if (!result.is_accepted()) {
            ++rejected;
            LOG_WARN(core::LogCategory::PUBLISH,
                     "transaction " + result.tx_hash + " rejected via " + name +
                     (result.detail.empty() ? "" : ": " + result.detail));
            continue;
        }

        PublishReceipt receipt;
        receipt.endpoint  = name;
        receipt.tx_hash   = result.tx_hash;
        receipt.gas_used  = result.gas_used;
        receipt.gas_price = request.gas_price;

        LOG_INFO(core::LogCategory::PUBLISH,
                 "published via " + name + ", tx " + result.tx_hash +
                 ", gas used " + std::to_string(result.gas_used));

        auto fee = compute_fee(result.gas_used, request.gas_price);
        if (fee.ok()) {
            receipt.fee = fee.value();
            auto recorded = ledger_.record(receipt.fee);
            if (recorded.ok()) {
                receipt.fee_recorded = true;
            } else {
                LOG_ERROR(core::LogCategory::FEES,
                          "fee " + receipt.fee.to_string() +
                          " ETH not recorded: " + recorded.error().format());
            }
        } else {
            LOG_ERROR(core::LogCategory::FEES, fee.error().format());
        }

        gas_.reset();
        LOG_DEBUG(core::LogCategory::GAS,
                  "gas price reset to " + eth::format_gwei(gas_.current()) +
                  " gwei");
        return receipt;
    }

    return core::make_error(core::ErrorCode::TX_ERROR,
        "no endpoint accepted the update (" +
        std::to_string(endpoints_.size()) + " endpoints: " +
        std::to_string(skipped) + " unreachable, " +
        std::to_string(rejected) + " rejected, " +
        std::to_string(failed) + " failed)");
}

} // namespace publish
