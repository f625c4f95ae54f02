#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>

namespace publish {

struct GasPricePolicy {
    uint64_t base = 1'300'000;   // wei
    uint64_t max  = 3'000'000;
    uint64_t step =   300'000;
};

// ---------------------------------------------------------------------------
// GasPriceController -- per-worker escalation state
// ---------------------------------------------------------------------------
// Starts at base. Each escalate() adds one step, clamped to max; only
// reset() (after a confirmed publish) brings the price back to base.
// Nothing else resets it, so a worker that keeps timing out keeps
// climbing across endpoints and cycles.
// ---------------------------------------------------------------------------
class GasPriceController {
public:
    enum class Escalation {
        RAISED,      // price increased (possibly clamped to max)
        SATURATED,   // already at max; price unchanged
    };

    /// Rejects base > max and step == 0.
    static core::Result<GasPriceController> create(const GasPricePolicy& policy);

    [[nodiscard]] uint64_t current() const { return current_; }
    [[nodiscard]] const GasPricePolicy& policy() const { return policy_; }
    [[nodiscard]] bool at_max() const { return current_ >= policy_.max; }

    Escalation escalate();
    void reset() { current_ = policy_.base; }

private:
    explicit GasPriceController(const GasPricePolicy& policy)
        : policy_(policy), current_(policy.base) {}

    GasPricePolicy policy_;
    uint64_t current_;
};

} // namespace publish
