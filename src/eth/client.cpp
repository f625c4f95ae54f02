// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eth/client.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/signal.h"
#include "core/time.h"
#include "eth/units.h"

#include <algorithm>

namespace eth {

namespace {

core::Result<uint64_t> quantity_field(const rpc::JsonValue& obj,
                                      const std::string& field) {
    const rpc::JsonValue& v = obj[field];
    if (!v.is_string()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "receipt field '" + field + "' missing");
    }
    return parse_quantity(v.get_string());
}

core::Result<core::Hash256> hash_value(const rpc::JsonValue& v) {
    if (!v.is_string()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "expected a 32-byte hex string");
    }
    auto hash = core::Hash256::from_hex(v.get_string());
    if (!hash) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "bad hash: " + v.get_string());
    }
    return *hash;
}

} // anonymous namespace

core::Result<TransactionReceipt> parse_receipt(const rpc::JsonValue& obj) {
    if (!obj.is_object()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "receipt is not an object");
    }

    TransactionReceipt receipt;
    CHAINBOARD_TRY_ASSIGN(hash, hash_value(obj["transactionHash"]));
    receipt.tx_hash = hash;

    CHAINBOARD_TRY_ASSIGN(status, quantity_field(obj, "status"));
    receipt.success = (status == 1);

    CHAINBOARD_TRY_ASSIGN(gas_used, quantity_field(obj, "gasUsed"));
    receipt.gas_used = gas_used;

    if (obj["blockNumber"].is_string()) {
        CHAINBOARD_TRY_ASSIGN(block, parse_quantity(obj["blockNumber"].get_string()));
        receipt.block_number = block;
    }
    if (obj["effectiveGasPrice"].is_string()) {
        CHAINBOARD_TRY_ASSIGN(price,
            parse_quantity(obj["effectiveGasPrice"].get_string()));
        receipt.effective_gas_price = price;
    }
    return receipt;
}

EthClient::EthClient(rpc::Url url, std::chrono::milliseconds request_timeout)
    : rpc_(std::move(url)), request_timeout_(request_timeout) {}

core::Result<rpc::JsonValue> EthClient::call(const std::string& method,
                                             rpc::JsonValue params) {
    return rpc_.call(method, std::move(params), request_timeout_);
}

core::Result<std::string> EthClient::client_version(
    std::chrono::milliseconds timeout) {
    CHAINBOARD_TRY_ASSIGN(result, rpc_.call("web3_clientVersion",
                                            rpc::JsonValue::Array{}, timeout));
    if (!result.is_string()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "web3_clientVersion: expected a string");
    }
    return result.get_string();
}

core::Result<uint64_t> EthClient::chain_id() {
    CHAINBOARD_TRY_ASSIGN(result, call("eth_chainId", rpc::JsonValue::Array{}));
    if (!result.is_string()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "eth_chainId: expected a quantity");
    }
    return parse_quantity(result.get_string());
}

core::Result<uint64_t> EthClient::transaction_count(
    const Address& account, const std::string& block_tag) {
    rpc::JsonValue::Array params{account.to_hex(), block_tag};
    CHAINBOARD_TRY_ASSIGN(result, call("eth_getTransactionCount", params));
    if (!result.is_string()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "eth_getTransactionCount: expected a quantity");
    }
    return parse_quantity(result.get_string());
}

core::Result<core::Hash256> EthClient::send_raw_transaction(
    std::span<const uint8_t> raw) {
    rpc::JsonValue::Array params{core::to_hex_prefixed(raw)};
    CHAINBOARD_TRY_ASSIGN(result, call("eth_sendRawTransaction", params));
    return hash_value(result);
}

core::Result<std::optional<TransactionReceipt>> EthClient::transaction_receipt(
    const core::Hash256& tx_hash) {
    rpc::JsonValue::Array params{tx_hash.to_hex_prefixed()};
    CHAINBOARD_TRY_ASSIGN(result, call("eth_getTransactionReceipt", params));
    if (result.is_null()) {
        return std::optional<TransactionReceipt>{};
    }
    CHAINBOARD_TRY_ASSIGN(receipt, parse_receipt(result));
    return std::optional<TransactionReceipt>(std::move(receipt));
}

core::Result<TransactionReceipt> EthClient::wait_for_receipt(
    const core::Hash256& tx_hash,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll) {
    const core::Deadline deadline(timeout);

    for (;;) {
        auto receipt = transaction_receipt(tx_hash);
        if (receipt.ok()) {
            if (receipt.value().has_value()) return *receipt.value();
        } else if (core::is_network_error(receipt.error().code())) {
            LOG_DEBUG(core::LogCategory::TX,
                      "receipt poll for " + tx_hash.to_hex_prefixed() +
                      " failed: " + receipt.error().message());
        } else {
            return std::move(receipt).error();
        }

        if (deadline.expired()) {
            return core::make_error(core::ErrorCode::NETWORK_TIMEOUT,
                "transaction " + tx_hash.to_hex_prefixed() +
                " not mined within " +
                std::to_string(timeout.count() / 1000) + " s");
        }
        if (!core::sleep_unless_shutdown(std::min(poll, deadline.remaining()))) {
            return core::make_error(core::ErrorCode::NETWORK_TIMEOUT,
                "shutdown requested while waiting for " +
                tx_hash.to_hex_prefixed());
        }
    }
}

} // namespace eth
