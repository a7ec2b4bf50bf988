#include "vault/errors.hpp"
#include "vault/vault_core.hpp"

#include "vault_fixture.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <memory>
#include <stdexcept>
#include <variant>
#include <vector>

using vault::ErrorCode;
using vault_test::error_code_of;
using vault_test::kManagerAccount;
using vault_test::kOwner;

namespace {

const vault::RebalanceEvent* last_rebalance(const std::vector<vault::VaultEvent>& events) {
    return events.empty() ? nullptr : std::get_if<vault::RebalanceEvent>(&events.back());
}

} // namespace

TEST_CASE("rebalance requires a position manager that asks for it") {
    vault_test::ScriptedVault fx;
    fx.fund("alice", 100);
    fx.vault.deposit("alice", 100);

    CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::PositionManagerNotSet);
    CHECK(fx.vault.current_delta() == 0);

    auto manager = fx.attach_manager();
    manager->needed = false;
    CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::RebalanceNotNeeded);
    CHECK(fx.spot->balance == 50);
    CHECK(fx.perp->balance == 50);
}

TEST_CASE("rebalance moves capital by the signed adjustments") {
    vault_test::ScriptedVault fx;
    auto manager = fx.attach_manager();
    std::vector<vault::VaultEvent> events;
    fx.fund("alice", 100);
    fx.vault.deposit("alice", 100);
    fx.vault.add_event_listener([&](const vault::VaultEvent& event) { events.push_back(event); });

    manager->needed = true;
    manager->delta_fn = [&] {
        return static_cast<vault::SignedAmount>(fx.spot->balance) - static_cast<vault::SignedAmount>(fx.perp->balance);
    };
    manager->amounts = vault::RebalanceAmounts{-20, 20};

    fx.vault.rebalance("keeper");
    CHECK(fx.spot->balance == 30);
    CHECK(fx.perp->balance == 70);
    CHECK(fx.vault.idle_assets() == 0);
    CHECK(fx.vault.total_assets() == 100);
    CHECK(fx.vault.total_shares() == 100);

    REQUIRE(manager->updates.size() == 2);
    CHECK(manager->updates.back().first == -20);
    CHECK(manager->updates.back().second == 20);

    const auto* rebalance = last_rebalance(events);
    REQUIRE(rebalance != nullptr);
    CHECK(rebalance->old_delta == 0);
    CHECK(rebalance->new_delta == -40);
}

TEST_CASE("rebalance with zero adjustments still records the delta") {
    vault_test::ScriptedVault fx;
    auto manager = fx.attach_manager();
    std::vector<vault::VaultEvent> events;
    fx.vault.add_event_listener([&](const vault::VaultEvent& event) { events.push_back(event); });
    fx.fund("alice", 100);
    fx.vault.deposit("alice", 100);

    manager->needed = true;
    manager->delta = 7;
    fx.vault.rebalance(kOwner);

    CHECK(fx.spot->withdraw_calls == 0);
    CHECK(fx.spot->deposit_calls == 1);
    CHECK(manager->updates.size() == 1);
    const auto* rebalance = last_rebalance(events);
    REQUIRE(rebalance != nullptr);
    CHECK(rebalance->old_delta == 7);
    CHECK(rebalance->new_delta == 7);
}

TEST_CASE("rebalance that cannot be funded leaves the legs untouched") {
    vault_test::ScriptedVault fx;
    auto manager = fx.attach_manager();
    fx.fund("alice", 100);
    fx.vault.deposit("alice", 100);
    manager->needed = true;

    SECTION("deposit larger than the recalled capital") {
        manager->amounts = vault::RebalanceAmounts{0, 30};
        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::InsufficientBalance);
        CHECK(fx.perp->deposit_calls == 1);
    }

    SECTION("receiving leg accepts only part of the transfer") {
        manager->amounts = vault::RebalanceAmounts{-20, 20};
        fx.perp->accept_limit = 5;
        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::StrategyDepositFailed);
        CHECK(fx.spot->deposit_calls == 2);   // recalled capital redeployed
    }

    SECTION("sending leg returns less than asked") {
        manager->amounts = vault::RebalanceAmounts{-20, 20};
        fx.spot->return_limit = 15;
        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::InsufficientBalance);
        CHECK(fx.perp->deposit_calls == 1);
    }

    SECTION("position manager rejects the update") {
        manager->amounts = vault::RebalanceAmounts{-20, 20};
        manager->fail_updates = true;
        CHECK_THROWS_AS(fx.vault.rebalance(kOwner), std::runtime_error);
    }

    SECTION("adjustment with no representable reversal") {
        manager->amounts = vault::RebalanceAmounts{std::numeric_limits<vault::SignedAmount>::min(), 0};
        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::ArithmeticOverflow);
        CHECK(fx.spot->withdraw_calls == 0);
    }

    CHECK(fx.spot->balance == 50);
    CHECK(fx.perp->balance == 50);
    CHECK(fx.vault.idle_assets() == 0);
    CHECK(manager->updates.size() == 1);
}

TEST_CASE("rebalance refuses to move capital into a missing leg") {
    auto asset = std::make_shared<sim::InMemoryAsset>();
    vault::VaultCore bare(vault::VaultParams{kOwner, vault::kMinDeposit}, asset);
    auto manager = std::make_shared<vault_test::ScriptedPositionManager>();
    bare.set_position_manager(kOwner, manager, kManagerAccount);
    manager->needed = true;
    manager->amounts = vault::RebalanceAmounts{-10, 10};

    CHECK(error_code_of([&] { bare.rebalance(kOwner); }) == ErrorCode::StrategyNotSet);
    CHECK(manager->updates.empty());
}

TEST_CASE("delta-neutral manager brings drifted legs back into balance") {
    vault_test::SimVault fx;
    std::vector<vault::VaultEvent> events;
    fx.vault.add_event_listener([&](const vault::VaultEvent& event) { events.push_back(event); });
    fx.fund("alice", 1000);
    fx.vault.deposit("alice", 1000);

    CHECK(fx.vault.current_delta() == 0);
    CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::RebalanceNotNeeded);

    fx.accrue(*fx.spot, 100);
    CHECK(fx.vault.current_delta() == 100);

    SECTION("capital moves from spot to perp") {
        fx.vault.rebalance(kOwner);
        CHECK(fx.spot->total_assets() == 550);
        CHECK(fx.perp->total_assets() == 550);
        CHECK(fx.vault.current_delta() == 0);
        CHECK(fx.vault.total_assets() == 1100);
        CHECK(fx.vault.idle_assets() == 0);
        CHECK(fx.manager->reported_spot() == 450);
        CHECK(fx.manager->reported_perp() == 550);
        CHECK(fx.manager->update_count() == 2);

        const auto* rebalance = last_rebalance(events);
        REQUIRE(rebalance != nullptr);
        CHECK(rebalance->old_delta == 100);
        CHECK(rebalance->new_delta == 0);

        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::RebalanceNotNeeded);
        CHECK(fx.vault.withdraw("alice", 1000) == 1100);
    }

    SECTION("locked spot liquidity aborts the move") {
        fx.spot->lock_liquidity(560);
        CHECK(error_code_of([&] { fx.vault.rebalance(kOwner); }) == ErrorCode::InsufficientBalance);
        CHECK(fx.spot->total_assets() == 600);
        CHECK(fx.perp->total_assets() == 500);
        CHECK(fx.manager->update_count() == 1);
        CHECK(fx.vault.check_invariants().ok());
    }
}
