#pragma once

#include "vault/strategy_adapter.hpp"

#include <mutex>
#include <string>

namespace sim {

// In-memory yield leg. A capacity models a supply cap (deposits beyond it are
// only partly accepted) and locked liquidity models a utilized lending pool
// (withdrawals beyond the unlocked balance are only partly returned).
class SimulatedStrategy : public vault::StrategyAdapter {
public:
    explicit SimulatedStrategy(std::string name, vault::Amount capacity = 0);

    vault::Amount deposit(vault::Amount amount) override;
    vault::Amount withdraw(vault::Amount amount) override;
    [[nodiscard]] vault::Amount total_assets() const override;
    [[nodiscard]] std::string name() const override { return name_; }

    void accrue_yield(vault::Amount amount);
    void realize_loss(vault::Amount amount);
    void lock_liquidity(vault::Amount amount);
    void unlock_liquidity(vault::Amount amount);

    [[nodiscard]] vault::Amount locked_liquidity() const;
    [[nodiscard]] vault::Amount capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::string name_;
    vault::Amount capacity_;
    vault::Amount balance_ = 0;
    vault::Amount locked_ = 0;
};

} // namespace sim
