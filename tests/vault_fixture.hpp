#pragma once

#include "sim/delta_neutral_position_manager.hpp"
#include "sim/in_memory_asset.hpp"
#include "sim/simulated_strategy.hpp"
#include "vault/errors.hpp"
#include "vault/position_manager.hpp"
#include "vault/strategy_adapter.hpp"
#include "vault/vault_core.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vault_test {

// Runs fn and returns the VaultError code it threw, if any.
template <typename Fn>
std::optional<vault::ErrorCode> error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const vault::VaultError& ex) {
        return ex.code();
    }
    return std::nullopt;
}

// Strategy whose reported amounts and side effects are set by the test.
class ScriptedStrategy : public vault::StrategyAdapter {
public:
    explicit ScriptedStrategy(std::string name)
        : name_(std::move(name)) {}

    vault::Amount deposit(vault::Amount amount) override {
        ++deposit_calls;
        if (on_deposit) {
            on_deposit(amount);
        }
        const vault::Amount accepted = accept_limit ? std::min(amount, *accept_limit) : amount;
        balance += accepted;
        return accepted;
    }

    vault::Amount withdraw(vault::Amount amount) override {
        ++withdraw_calls;
        if (on_withdraw) {
            on_withdraw(amount);
        }
        vault::Amount returned = std::min(amount, balance);
        if (return_limit) {
            returned = std::min(returned, *return_limit);
        }
        balance -= returned;
        return returned;
    }

    [[nodiscard]] vault::Amount total_assets() const override { return balance; }
    [[nodiscard]] std::string name() const override { return name_; }

    vault::Amount balance = 0;
    std::optional<vault::Amount> accept_limit;
    std::optional<vault::Amount> return_limit;
    std::function<void(vault::Amount)> on_deposit;
    std::function<void(vault::Amount)> on_withdraw;
    int deposit_calls = 0;
    int withdraw_calls = 0;

private:
    std::string name_;
};

// Position manager returning whatever the test configured.
class ScriptedPositionManager : public vault::PositionManager {
public:
    [[nodiscard]] bool is_rebalance_needed() const override { return needed; }
    [[nodiscard]] vault::SignedAmount current_delta() const override {
        return delta_fn ? delta_fn() : delta;
    }
    [[nodiscard]] vault::RebalanceAmounts calculate_rebalance_amounts() const override {
        if (on_calculate) {
            on_calculate();
        }
        return amounts;
    }

    void update_position(vault::SignedAmount spot_change, vault::SignedAmount perp_change) override {
        if (fail_updates) {
            throw std::runtime_error("position update rejected");
        }
        if (on_update) {
            on_update();
        }
        updates.emplace_back(spot_change, perp_change);
    }

    bool needed = false;
    bool fail_updates = false;
    vault::SignedAmount delta = 0;
    std::function<vault::SignedAmount()> delta_fn;
    vault::RebalanceAmounts amounts;
    std::vector<std::pair<vault::SignedAmount, vault::SignedAmount>> updates;
    std::function<void()> on_update;
    std::function<void()> on_calculate;
};

inline const vault::Account kOwner = "owner";
inline const vault::Account kManagerAccount = "position-manager";

// A vault wired to scripted legs and an in-memory token.
struct ScriptedVault {
    std::shared_ptr<sim::InMemoryAsset> asset = std::make_shared<sim::InMemoryAsset>();
    std::shared_ptr<ScriptedStrategy> spot = std::make_shared<ScriptedStrategy>("spot");
    std::shared_ptr<ScriptedStrategy> perp = std::make_shared<ScriptedStrategy>("perp");
    vault::VaultCore vault{vault::VaultParams{kOwner, vault::kMinDeposit}, asset};

    ScriptedVault() {
        vault.set_spot_strategy(kOwner, spot);
        vault.set_perp_strategy(kOwner, perp);
    }

    std::shared_ptr<ScriptedPositionManager> attach_manager() {
        auto manager = std::make_shared<ScriptedPositionManager>();
        vault.set_position_manager(kOwner, manager, kManagerAccount);
        return manager;
    }

    void fund(const vault::Account& account, vault::Amount amount) { asset->mint(account, amount); }

    vault::Amount deployed() const { return spot->balance + perp->balance; }
};

// A vault wired to the simulated legs and the delta-neutral manager.
struct SimVault {
    std::shared_ptr<sim::InMemoryAsset> asset = std::make_shared<sim::InMemoryAsset>();
    std::shared_ptr<sim::SimulatedStrategy> spot = std::make_shared<sim::SimulatedStrategy>("spot-lending");
    std::shared_ptr<sim::SimulatedStrategy> perp = std::make_shared<sim::SimulatedStrategy>("perp-hedge");
    std::shared_ptr<sim::DeltaNeutralPositionManager> manager =
        std::make_shared<sim::DeltaNeutralPositionManager>(spot, perp);
    vault::VaultCore vault{vault::VaultParams{kOwner, vault::kMinDeposit}, asset};

    SimVault() {
        vault.set_spot_strategy(kOwner, spot);
        vault.set_perp_strategy(kOwner, perp);
        vault.set_position_manager(kOwner, manager, kManagerAccount);
    }

    void fund(const vault::Account& account, vault::Amount amount) { asset->mint(account, amount); }

    void accrue(sim::SimulatedStrategy& leg, vault::Amount amount) {
        leg.accrue_yield(amount);
        asset->credit_custody(amount);
    }
};

} // namespace vault_test
