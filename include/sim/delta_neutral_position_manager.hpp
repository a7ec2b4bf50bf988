#pragma once

#include "vault/position_manager.hpp"
#include "vault/strategy_adapter.hpp"

#include <cstdint>
#include <memory>

namespace sim {

// Treats the spot leg as long exposure and the perp leg as an equal short
// hedge, so delta is the difference between the two live balances. Sizing
// moves half the difference from the heavier leg to the lighter one.
class DeltaNeutralPositionManager : public vault::PositionManager {
public:
    DeltaNeutralPositionManager(std::shared_ptr<const vault::StrategyAdapter> spot,
                                std::shared_ptr<const vault::StrategyAdapter> perp,
                                std::uint32_t tolerance_bps = vault::kMaxDeltaToleranceBps);

    [[nodiscard]] bool is_rebalance_needed() const override;
    [[nodiscard]] vault::SignedAmount current_delta() const override;
    [[nodiscard]] vault::RebalanceAmounts calculate_rebalance_amounts() const override;
    void update_position(vault::SignedAmount spot_change, vault::SignedAmount perp_change) override;

    [[nodiscard]] vault::SignedAmount reported_spot() const { return reported_spot_; }
    [[nodiscard]] vault::SignedAmount reported_perp() const { return reported_perp_; }
    [[nodiscard]] std::uint64_t update_count() const { return update_count_; }
    [[nodiscard]] std::uint32_t tolerance_bps() const { return tolerance_bps_; }

private:
    std::shared_ptr<const vault::StrategyAdapter> spot_;
    std::shared_ptr<const vault::StrategyAdapter> perp_;
    std::uint32_t tolerance_bps_;
    vault::SignedAmount reported_spot_ = 0;
    vault::SignedAmount reported_perp_ = 0;
    std::uint64_t update_count_ = 0;
};

} // namespace sim
