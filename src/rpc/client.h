#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "rpc/http.h"
#include "rpc/request.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace rpc {

/// JSON-RPC 2.0 client bound to one endpoint URL. Not thread-safe; each
/// worker owns its own clients.
class JsonRpcClient {
public:
    explicit JsonRpcClient(Url url) : url_(std::move(url)) {}

    /// Invoke @p method and return its "result" member.
    ///
    /// Errors:
    ///  - transport failures keep their NETWORK_* code (NETWORK_TIMEOUT
    ///    when @p timeout expires);
    ///  - an "error" member in the response becomes RPC_REMOTE_ERROR;
    ///  - a non-2xx status without a JSON-RPC error becomes NETWORK_ERROR;
    ///  - an unparsable body or mismatched id becomes RPC_BAD_RESPONSE.
    core::Result<JsonValue> call(const std::string& method,
                                 JsonValue params,
                                 std::chrono::milliseconds timeout);

    [[nodiscard]] const Url& url() const { return url_; }

private:
    Url        url_;
    HttpClient http_;
    int64_t    next_id_ = 1;
};

} // namespace rpc
