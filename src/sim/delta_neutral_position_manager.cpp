#include "sim/delta_neutral_position_manager.hpp"

#include "vault/math.hpp"

#include <stdexcept>
#include <utility>

namespace sim {

DeltaNeutralPositionManager::DeltaNeutralPositionManager(std::shared_ptr<const vault::StrategyAdapter> spot,
                                                         std::shared_ptr<const vault::StrategyAdapter> perp,
                                                         std::uint32_t tolerance_bps)
    : spot_(std::move(spot)),
      perp_(std::move(perp)),
      tolerance_bps_(tolerance_bps) {
    if (!spot_ || !perp_) {
        throw std::invalid_argument("DeltaNeutralPositionManager requires both legs");
    }
}

bool DeltaNeutralPositionManager::is_rebalance_needed() const {
    const vault::WideAmount gross = static_cast<vault::WideAmount>(spot_->total_assets()) + perp_->total_assets();
    if (gross == 0) {
        return false;
    }
    const vault::WideAmount drift = static_cast<vault::WideAmount>(vault::magnitude(current_delta())) *
                                    vault::kBasisPointScale;
    return drift > gross * tolerance_bps_;
}

vault::SignedAmount DeltaNeutralPositionManager::current_delta() const {
    return vault::to_signed(spot_->total_assets()) - vault::to_signed(perp_->total_assets());
}

vault::RebalanceAmounts DeltaNeutralPositionManager::calculate_rebalance_amounts() const {
    const vault::SignedAmount shift = current_delta() / 2;
    return vault::RebalanceAmounts{-shift, shift};
}

void DeltaNeutralPositionManager::update_position(vault::SignedAmount spot_change,
                                                  vault::SignedAmount perp_change) {
    const vault::SignedAmount spot = vault::checked_signed_add(reported_spot_, spot_change);
    const vault::SignedAmount perp = vault::checked_signed_add(reported_perp_, perp_change);
    reported_spot_ = spot;
    reported_perp_ = perp;
    ++update_count_;
}

} // namespace sim
