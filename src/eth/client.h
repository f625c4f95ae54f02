#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "eth/address.h"
#include "rpc/client.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace eth {

struct TransactionReceipt {
    core::Hash256 tx_hash;
    bool          success = false;    // status == 0x1
    uint64_t      gas_used = 0;
    uint64_t      block_number = 0;
    std::optional<uint64_t> effective_gas_price;
};

/// Typed wrapper over the eth_* / web3_* JSON-RPC methods the publisher
/// needs. Every call is bounded by the request timeout given at
/// construction unless a method takes its own.
class EthClient {
public:
    EthClient(rpc::Url url, std::chrono::milliseconds request_timeout);

    core::Result<std::string> client_version(std::chrono::milliseconds timeout);
    core::Result<uint64_t> chain_id();

    /// eth_getTransactionCount for @p block_tag ("latest", "pending").
    core::Result<uint64_t> transaction_count(const Address& account,
                                             const std::string& block_tag);

    core::Result<core::Hash256> send_raw_transaction(
        std::span<const uint8_t> raw);

    /// nullopt while the transaction is not yet mined.
    core::Result<std::optional<TransactionReceipt>> transaction_receipt(
        const core::Hash256& tx_hash);

    /// Poll for a receipt every @p poll until @p timeout. Expiry, or a
    /// shutdown request while waiting, yields NETWORK_TIMEOUT. Transport
    /// errors on individual polls are retried until the deadline.
    core::Result<TransactionReceipt> wait_for_receipt(
        const core::Hash256& tx_hash,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds poll);

    [[nodiscard]] const rpc::Url& url() const { return rpc_.url(); }

private:
    core::Result<rpc::JsonValue> call(const std::string& method,
                                      rpc::JsonValue params);

    rpc::JsonRpcClient rpc_;
    std::chrono::milliseconds request_timeout_;
};

/// Decode an eth_getTransactionReceipt result object.
core::Result<TransactionReceipt> parse_receipt(const rpc::JsonValue& obj);

} // namespace eth
