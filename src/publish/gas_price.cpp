#include "publish/gas_price.h"

#include <string>

namespace publish {

core::Result<GasPriceController> GasPriceController::create(
    const GasPricePolicy& policy) {
    if (policy.base > policy.max) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
            "base gas price " + std::to_string(policy.base) +
            " exceeds maximum " + std::to_string(policy.max));
    }
    if (policy.step == 0) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "gas price step must be positive");
    }
    return GasPriceController(policy);
}

GasPriceController::Escalation GasPriceController::escalate() {
    if (current_ >= policy_.max) {
        return Escalation::SATURATED;
    }
    const uint64_t room = policy_.max - current_;
    current_ += (policy_.step < room) ? policy_.step : room;
    return Escalation::RAISED;
}

} // namespace publish
