#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "publish/endpoint.h"
#include "publish/fee_amount.h"
#include "publish/fee_ledger.h"
#include "publish/gas_price.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace publish {

/// What a successful publish() reports back.
struct PublishReceipt {
    std::string endpoint;
    std::string tx_hash;
    uint64_t    gas_used = 0;
    uint64_t    gas_price = 0;   // price paid, wei
    FeeAmount   fee;
    bool        fee_recorded = false;
};

/// Computes gas_used * gas_price in wei and converts to ledger units.
/// Fails with VALIDATION_RANGE if the product does not fit in 64 bits.
core::Result<FeeAmount> compute_fee(uint64_t gas_used, uint64_t gas_price);

// ---------------------------------------------------------------------------
// TransactionSubmitter
// ---------------------------------------------------------------------------
// One publish() walks the endpoints in their fixed order:
//   - unreachable endpoint:    skipped, price untouched
//   - REJECTED outcome:        logged, next endpoint, price untouched
//   - error (timeout/transport): price escalated, next endpoint
//   - ACCEPTED outcome:        fee recorded, price reset, stop
// A ledger failure after acceptance is logged; the publish still counts.
// ---------------------------------------------------------------------------
class TransactionSubmitter {
public:
    /// @p endpoints, @p gas and @p ledger must outlive the submitter.
    TransactionSubmitter(const std::vector<std::unique_ptr<Endpoint>>& endpoints,
                         GasPriceController& gas,
                         FeeLedger& ledger,
                         core::Bytes32 token_id,
                         core::Bytes32 key,
                         uint64_t gas_limit);

    /// TX_ERROR when every endpoint was skipped, rejected or failed.
    core::Result<PublishReceipt> publish(const std::string& document);

private:
    const std::vector<std::unique_ptr<Endpoint>>& endpoints_;
    GasPriceController& gas_;
    FeeLedger& ledger_;
    core::Bytes32 token_id_;
    core::Bytes32 key_;
    uint64_t gas_limit_;
};

} // namespace publish
