// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/client.h"

#include "core/logging.h"

namespace rpc {

core::Result<JsonValue> JsonRpcClient::call(const std::string& method,
                                            JsonValue params,
                                            std::chrono::milliseconds timeout) {
    RpcRequest req;
    req.method = method;
    req.params = std::move(params);
    req.id     = next_id_++;

    LOG_TRACE(core::LogCategory::RPC,
              url_.redacted() + " <- " + method + " #" + std::to_string(req.id));

    CHAINBOARD_TRY_ASSIGN(http_resp, http_.post(url_, req.serialize(), timeout));

    auto parsed = try_parse_json(http_resp.body);
    if (!http_resp.is_success()) {
        // Some providers report JSON-RPC errors with a 4xx/5xx status.
        if (parsed.ok()) {
            auto rpc_resp = RpcResponse::from_json(parsed.value());
            if (rpc_resp.ok() && rpc_resp.value().is_error()) {
                return core::make_error(core::ErrorCode::RPC_REMOTE_ERROR,
                    method + ": " + rpc_resp.value().error_text());
            }
        }
        return core::make_error(core::ErrorCode::NETWORK_ERROR,
            method + ": HTTP status " + std::to_string(http_resp.status));
    }

    if (!parsed.ok()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
            method + ": " + parsed.error().message());
    }

    auto rpc_resp = RpcResponse::from_json(parsed.value());
    if (!rpc_resp.ok()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
            method + ": " + rpc_resp.error().message());
    }
    RpcResponse& resp = rpc_resp.value();

    if (resp.is_error()) {
        LOG_DEBUG(core::LogCategory::RPC,
                  method + " failed: " + resp.error_text());
        return core::make_error(core::ErrorCode::RPC_REMOTE_ERROR,
                                method + ": " + resp.error_text());
    }
    if (resp.id != req.id) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
            method + ": response id " + std::to_string(resp.id) +
            " does not match request id " + std::to_string(req.id));
    }
    return std::move(resp.result);
}

} // namespace rpc
