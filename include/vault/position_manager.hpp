#pragma once

#include "vault/types.hpp"

namespace vault {

// Signed per-leg capital movements. Negative withdraws that magnitude from the
// leg into idle, positive deposits that magnitude from idle into the leg.
struct RebalanceAmounts {
    SignedAmount spot_adjustment = 0;
    SignedAmount perp_adjustment = 0;
};

// Tracks the vault's directional exposure. Positive delta is net long,
// negative is net short, zero is the neutral target.
class PositionManager {
public:
    virtual ~PositionManager() = default;

    [[nodiscard]] virtual bool is_rebalance_needed() const = 0;
    [[nodiscard]] virtual SignedAmount current_delta() const = 0;
    [[nodiscard]] virtual RebalanceAmounts calculate_rebalance_amounts() const = 0;

    // Per-leg change in deployed capital since the previous report.
    virtual void update_position(SignedAmount spot_change, SignedAmount perp_change) = 0;
};

} // namespace vault
