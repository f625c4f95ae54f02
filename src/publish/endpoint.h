#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <cstdint>
#include <string>

namespace publish {

/// Everything one remote write carries apart from the signing identity,
/// nonce and chain id, which the endpoint resolves itself per attempt.
struct WriteRequest {
    core::Bytes32 token_id;
    core::Bytes32 key;
    std::string   document;
    uint64_t      gas_price = 0;   // wei
    uint64_t      gas_limit = 0;
};

/// Final status of a write the remote side confirmed.
struct SubmitOutcome {
    enum class Status { ACCEPTED, REJECTED };

    Status      status = Status::REJECTED;
    uint64_t    gas_used = 0;      // meaningful when ACCEPTED
    std::string tx_hash;
    std::string detail;

    static SubmitOutcome accepted(uint64_t gas_used, std::string tx_hash) {
        SubmitOutcome o;
        o.status = Status::ACCEPTED;
        o.gas_used = gas_used;
        o.tx_hash = std::move(tx_hash);
        return o;
    }

    static SubmitOutcome rejected(std::string tx_hash, std::string detail) {
        SubmitOutcome o;
        o.status = Status::REJECTED;
        o.tx_hash = std::move(tx_hash);
        o.detail = std::move(detail);
        return o;
    }

    [[nodiscard]] bool is_accepted() const { return status == Status::ACCEPTED; }
};

// ---------------------------------------------------------------------------
// Endpoint -- one remote ledger access point
// ---------------------------------------------------------------------------
// submit() blocks until the write is confirmed either way or its bounded
// wait expires. An error result means the outcome is unknown (timeout or
// transport failure); a confirmed refusal is a REJECTED outcome.
// ---------------------------------------------------------------------------
class Endpoint {
public:
    virtual ~Endpoint() = default;

    /// Label for log lines. Must not contain credentials.
    [[nodiscard]] virtual std::string name() const = 0;

    /// Liveness probe, evaluated fresh on every call.
    virtual bool is_reachable() = 0;

    virtual core::Result<SubmitOutcome> submit(const WriteRequest& request) = 0;
};

} // namespace publish
