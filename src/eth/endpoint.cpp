// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eth/endpoint.h"

#include "core/logging.h"
#include "eth/abi.h"
#include "eth/transaction.h"
#include "eth/units.h"

namespace eth {

EthEndpoint::EthEndpoint(rpc::Url url, const crypto::ECKey& signer,
                         Address contract, EndpointTimeouts timeouts)
    : client_(std::move(url), timeouts.request),
      signer_(signer),
      sender_(Address::from_pubkey(signer.pubkey_uncompressed())),
      contract_(contract),
      timeouts_(timeouts) {}

std::string EthEndpoint::name() const {
    return client_.url().redacted();
}

bool EthEndpoint::is_reachable() {
    auto version = client_.client_version(timeouts_.probe);
    if (!version.ok()) {
        LOG_DEBUG(core::LogCategory::RPC,
                  name() + " probe failed: " + version.error().message());
        return false;
    }
    LOG_TRACE(core::LogCategory::RPC, name() + " is " + version.value());
    return true;
}

core::Result<publish::SubmitOutcome> EthEndpoint::submit(
    const publish::WriteRequest& request) {
    CHAINBOARD_TRY_ASSIGN(chain_id, client_.chain_id());
    // Latest, not pending: a re-send after a timeout reuses the nonce of
    // the stuck transaction and replaces it at the higher price.
    CHAINBOARD_TRY_ASSIGN(nonce, client_.transaction_count(sender_, "latest"));

    LegacyTransaction tx;
    tx.nonce     = nonce;
    tx.gas_price = request.gas_price;
    tx.gas_limit = request.gas_limit;
    tx.to        = contract_;
    tx.value     = 0;
    tx.data      = abi::encode_store_string(request.token_id, request.key,
                                            request.document);
    tx.chain_id  = chain_id;
    CHAINBOARD_TRY_VOID(tx.sign(signer_));

    const std::vector<uint8_t> raw = tx.raw();
    const std::string local_hash = tx.hash().to_hex_prefixed();

    auto sent = client_.send_raw_transaction(raw);
    if (!sent.ok()) {
        if (sent.error().code() == core::ErrorCode::RPC_REMOTE_ERROR) {
            return publish::SubmitOutcome::rejected(local_hash,
                                                    sent.error().message());
        }
        return std::move(sent).error();
    }
    const core::Hash256 tx_hash = sent.value();

    LOG_INFO(core::LogCategory::TX,
             "sent " + tx_hash.to_hex_prefixed() + " via " + name() +
             " (nonce " + std::to_string(nonce) + ", gas price " +
             format_gwei(request.gas_price) + " gwei, " +
             std::to_string(raw.size()) + " bytes), waiting for receipt");

    CHAINBOARD_TRY_ASSIGN(receipt, client_.wait_for_receipt(
        tx_hash, timeouts_.receipt, timeouts_.receipt_poll));

    if (!receipt.success) {
        return publish::SubmitOutcome::rejected(
            tx_hash.to_hex_prefixed(),
            "status 0 in block " + std::to_string(receipt.block_number));
    }
    return publish::SubmitOutcome::accepted(receipt.gas_used,
                                            tx_hash.to_hex_prefixed());
}

} // namespace eth
