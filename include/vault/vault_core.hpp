#pragma once

#include "vault/base_asset.hpp"
#include "vault/events.hpp"
#include "vault/position_manager.hpp"
#include "vault/share_ledger.hpp"
#include "vault/strategy_adapter.hpp"
#include "vault/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vault {

class UnwindLog;

struct VaultParams {
    Account owner;
    Amount min_deposit = kMinDeposit;
};

struct VaultSnapshot {
    Amount total_assets = 0;
    Amount idle_assets = 0;
    Amount spot_assets = 0;
    Amount perp_assets = 0;
    Amount total_shares = 0;
    Amount share_price = 0;       // assets per share scaled by kPrecision
    Amount net_contributed = 0;
    SignedAmount delta = 0;
    bool paused = false;
    bool has_position_manager = false;
};

struct InvariantReport {
    std::vector<std::string> violations;

    [[nodiscard]] bool ok() const { return violations.empty(); }
};

// Share accounting and capital allocation across a spot leg and a perp leg.
//
// Every mutating call either completes or leaves the vault and its
// collaborators as they were: each step records a compensating action that
// is replayed if a later step throws. Calls are serialized per instance; a
// nested call from a collaborator callback fails with ReentrantCall.
class VaultCore {
public:
    using EventListener = std::function<void(const VaultEvent&)>;
    // Returned by a listener that keeps a record of the event; invoked if the
    // operation that emitted the event is rolled back.
    using EventUndo = std::function<void()>;
    using UndoableEventListener = std::function<EventUndo(const VaultEvent&)>;

    VaultCore(VaultParams params, std::shared_ptr<BaseAsset> asset);

    VaultCore(const VaultCore&) = delete;
    VaultCore& operator=(const VaultCore&) = delete;

    Amount deposit(const Account& caller, Amount assets);
    Amount withdraw(const Account& caller, Amount shares);
    void rebalance(const Account& caller);
    void transfer_shares(const Account& caller, const Account& to, Amount shares);

    // Position-manager only: reports yield accrued inside the legs since the
    // last report.
    void sync_position(const Account& caller);

    // Administration (owner only).
    void set_spot_strategy(const Account& caller, std::shared_ptr<StrategyAdapter> strategy);
    void set_perp_strategy(const Account& caller, std::shared_ptr<StrategyAdapter> strategy);
    void set_position_manager(const Account& caller,
                              std::shared_ptr<PositionManager> manager,
                              Account manager_account);
    void emergency_pause(const Account& caller);
    void emergency_unpause(const Account& caller);
    void transfer_ownership(const Account& caller, Account new_owner);

    void add_event_listener(EventListener listener);
    void add_undoable_event_listener(UndoableEventListener listener);

    [[nodiscard]] Amount total_assets() const;
    [[nodiscard]] Amount preview_deposit(Amount assets) const;
    [[nodiscard]] Amount preview_withdraw(Amount shares) const;
    [[nodiscard]] SignedAmount current_delta() const;
    [[nodiscard]] bool is_paused() const;
    [[nodiscard]] Amount shares_of(const Account& owner) const;
    [[nodiscard]] Amount total_shares() const;
    [[nodiscard]] Amount idle_assets() const;
    [[nodiscard]] Amount share_price() const;
    [[nodiscard]] Amount net_contributed() const;
    [[nodiscard]] Account owner() const;
    [[nodiscard]] Amount min_deposit() const { return params_.min_deposit; }
    [[nodiscard]] bool has_position_manager() const;
    [[nodiscard]] VaultSnapshot snapshot() const;
    [[nodiscard]] InvariantReport check_invariants() const;

private:
    class EntryGuard;

    Amount calculate_shares(Amount assets) const;
    void require_owner(const Account& caller) const;
    void require_not_paused() const;

    void deploy(UnwindLog& unwind, StrategyLeg leg, Amount amount);
    void recall(UnwindLog& unwind, StrategyLeg leg, Amount amount);
    void report_position(UnwindLog& unwind, SignedAmount spot_change, SignedAmount perp_change);
    void credit_idle(UnwindLog& unwind, Amount amount);
    void debit_idle(UnwindLog& unwind, Amount amount);
    void emit(UnwindLog& unwind, const VaultEvent& event);
    void abort_operation(const char* operation, UnwindLog& unwind);

    const std::shared_ptr<StrategyAdapter>& strategy_for(StrategyLeg leg) const;
    bool strategies_set() const;

    VaultParams params_;
    std::shared_ptr<BaseAsset> asset_;
    ShareLedger ledger_;
    Amount idle_assets_ = 0;
    Amount total_deposited_ = 0;
    Amount total_withdrawn_ = 0;
    bool paused_ = false;
    bool entered_ = false;

    std::shared_ptr<StrategyAdapter> spot_strategy_;
    std::shared_ptr<StrategyAdapter> perp_strategy_;
    std::shared_ptr<PositionManager> position_manager_;
    Account position_manager_account_;
    SignedAmount reported_spot_ = 0;
    SignedAmount reported_perp_ = 0;

    std::vector<UndoableEventListener> listeners_;
    mutable std::recursive_mutex mutex_;
};

} // namespace vault
