#include "vault/vault_core.hpp"

#include "vault/errors.hpp"
#include "vault/math.hpp"
#include "vault/unwind_log.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

namespace vault {
namespace {

std::string describe_current_exception() {
    try {
        throw;
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown error";
    }
}

void require_account(const Account& account, const char* role) {
    if (account.empty()) {
        throw VaultError(ErrorCode::ZeroAddress, std::string(role) + " account must not be empty");
    }
}

} // namespace

// Marks the vault as inside a mutating operation for the guard's lifetime.
class VaultCore::EntryGuard {
public:
    explicit EntryGuard(bool& entered)
        : entered_(entered) {
        if (entered_) {
            throw VaultError(ErrorCode::ReentrantCall, "vault operation already in progress");
        }
        entered_ = true;
    }

    ~EntryGuard() { entered_ = false; }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

private:
    bool& entered_;
};

VaultCore::VaultCore(VaultParams params, std::shared_ptr<BaseAsset> asset)
    : params_(std::move(params)),
      asset_(std::move(asset)) {
    require_account(params_.owner, "owner");
    if (!asset_) {
        throw VaultError(ErrorCode::ZeroAddress, "base asset must be provided");
    }
    std::cout << "[Vault] Initialized owner=" << params_.owner
              << " min_deposit=" << params_.min_deposit << std::endl;
}

// ---------------------------------------------------------------------------
// Deposit / withdraw
// ---------------------------------------------------------------------------

Amount VaultCore::deposit(const Account& caller, Amount assets) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_not_paused();
    require_account(caller, "depositor");
    if (assets == 0) {
        throw VaultError(ErrorCode::ZeroAmount, "deposit amount must be positive");
    }
    if (assets < params_.min_deposit) {
        throw VaultError(ErrorCode::DepositTooSmall,
                         "deposit " + std::to_string(assets) + " below minimum " +
                         std::to_string(params_.min_deposit));
    }
    if (!strategies_set()) {
        throw VaultError(ErrorCode::StrategyNotSet, "spot and perp strategies must be set before deposits");
    }

    // Priced against the valuation before the new assets arrive.
    const Amount shares = calculate_shares(assets);
    const Amount spot_amount = assets / 2;
    const Amount perp_amount = assets - spot_amount;

    UnwindLog unwind;
    try {
        asset_->transfer_in(caller, assets);
        unwind.record("refund " + caller, [this, caller, assets] { asset_->transfer_out(caller, assets); });
        credit_idle(unwind, assets);

        ledger_.mint(caller, shares);
        unwind.record("burn minted shares", [this, caller, shares] { ledger_.burn(caller, shares); });

        const Amount deposited_before = total_deposited_;
        total_deposited_ = checked_add(total_deposited_, assets);
        unwind.record("restore deposit total", [this, deposited_before] { total_deposited_ = deposited_before; });

        deploy(unwind, StrategyLeg::Spot, spot_amount);
        deploy(unwind, StrategyLeg::Perp, perp_amount);
        if (position_manager_) {
            report_position(unwind, to_signed(spot_amount), to_signed(perp_amount));
        }

        emit(unwind, DepositEvent{caller, assets, shares});
    } catch (...) {
        abort_operation("deposit", unwind);
        throw;
    }
    unwind.commit();

    std::cout << "[Vault] Deposit " << caller << " assets=" << assets << " shares=" << shares
              << " spot=" << spot_amount << " perp=" << perp_amount << std::endl;
    return shares;
}

Amount VaultCore::withdraw(const Account& caller, Amount shares) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_not_paused();
    require_account(caller, "withdrawer");
    if (shares == 0) {
        throw VaultError(ErrorCode::ZeroAmount, "withdraw shares must be positive");
    }
    const Amount balance = ledger_.balance_of(caller);
    if (balance < shares) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         caller + " holds " + std::to_string(balance) + " shares, requested " +
                         std::to_string(shares));
    }

    const Amount assets = preview_withdraw(shares);
    if (assets == 0) {
        throw VaultError(ErrorCode::ZeroAmount, "withdrawal of " + std::to_string(shares) + " shares is worth zero assets");
    }

    // Each leg gives up the same fraction of its balance; measured once.
    const Amount total = total_assets();
    const bool deployed = strategies_set();
    const Amount spot_balance = deployed ? spot_strategy_->total_assets() : 0;
    const Amount perp_balance = deployed ? perp_strategy_->total_assets() : 0;
    Amount spot_pull = spot_balance == 0 ? 0 : mul_div(assets, spot_balance, total);
    Amount perp_pull = perp_balance == 0 ? 0 : mul_div(assets, perp_balance, total);

    const Amount available = checked_add(idle_assets_, checked_add(spot_pull, perp_pull));
    if (available < assets) {
        // Flooring left the legs a few units short; the remainder goes to perp.
        const Amount shortfall = assets - available;
        if (perp_balance - perp_pull >= shortfall) {
            perp_pull += shortfall;
        } else if (spot_balance - spot_pull >= shortfall) {
            spot_pull += shortfall;
        } else {
            throw VaultError(ErrorCode::InsufficientBalance,
                             "strategies cannot cover withdrawal of " + std::to_string(assets));
        }
    }

    UnwindLog unwind;
    try {
        ledger_.burn(caller, shares);
        unwind.record("re-mint burned shares", [this, caller, shares] { ledger_.mint(caller, shares); });

        const Amount withdrawn_before = total_withdrawn_;
        total_withdrawn_ = checked_add(total_withdrawn_, assets);
        unwind.record("restore withdrawal total", [this, withdrawn_before] { total_withdrawn_ = withdrawn_before; });

        recall(unwind, StrategyLeg::Spot, spot_pull);
        recall(unwind, StrategyLeg::Perp, perp_pull);
        if (position_manager_ && (spot_pull != 0 || perp_pull != 0)) {
            report_position(unwind, negate(spot_pull), negate(perp_pull));
        }

        debit_idle(unwind, assets);
        asset_->transfer_out(caller, assets);
        unwind.record("reclaim payout from " + caller, [this, caller, assets] { asset_->transfer_in(caller, assets); });

        emit(unwind, WithdrawEvent{caller, assets, shares});
    } catch (...) {
        abort_operation("withdraw", unwind);
        throw;
    }
    unwind.commit();

    std::cout << "[Vault] Withdraw " << caller << " shares=" << shares << " assets=" << assets
              << " spot=" << spot_pull << " perp=" << perp_pull << std::endl;
    return assets;
}

void VaultCore::transfer_shares(const Account& caller, const Account& to, Amount shares) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_not_paused();
    require_account(caller, "sender");
    require_account(to, "recipient");
    if (shares == 0) {
        throw VaultError(ErrorCode::ZeroAmount, "transfer shares must be positive");
    }
    const Amount balance = ledger_.balance_of(caller);
    if (balance < shares) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         caller + " holds " + std::to_string(balance) + " shares, transferring " +
                         std::to_string(shares));
    }

    UnwindLog unwind;
    try {
        ledger_.transfer(caller, to, shares);
        unwind.record("return transferred shares", [this, caller, to, shares] { ledger_.transfer(to, caller, shares); });
        emit(unwind, SharesTransferredEvent{caller, to, shares});
    } catch (...) {
        abort_operation("transfer", unwind);
        throw;
    }
    unwind.commit();
}

// ---------------------------------------------------------------------------
// Position management
// ---------------------------------------------------------------------------

void VaultCore::rebalance(const Account& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_not_paused();
    if (!position_manager_) {
        throw VaultError(ErrorCode::PositionManagerNotSet, "rebalance requires a position manager");
    }
    if (!position_manager_->is_rebalance_needed()) {
        throw VaultError(ErrorCode::RebalanceNotNeeded, "position manager reports delta within tolerance");
    }

    SignedAmount old_delta = 0;
    SignedAmount new_delta = 0;
    RebalanceAmounts amounts;
    UnwindLog unwind;
    try {
        old_delta = position_manager_->current_delta();
        amounts = position_manager_->calculate_rebalance_amounts();
        if ((amounts.spot_adjustment != 0 && !spot_strategy_) ||
            (amounts.perp_adjustment != 0 && !perp_strategy_)) {
            throw VaultError(ErrorCode::StrategyNotSet, "rebalance adjusts a leg with no strategy");
        }
        if (amounts.spot_adjustment == std::numeric_limits<SignedAmount>::min() ||
            amounts.perp_adjustment == std::numeric_limits<SignedAmount>::min()) {
            throw VaultError(ErrorCode::ArithmeticOverflow, "rebalance adjustment cannot be reversed");
        }

        // Withdrawals first so that deposits can be funded from the proceeds.
        if (amounts.spot_adjustment < 0) {
            recall(unwind, StrategyLeg::Spot, magnitude(amounts.spot_adjustment));
        }
        if (amounts.perp_adjustment < 0) {
            recall(unwind, StrategyLeg::Perp, magnitude(amounts.perp_adjustment));
        }
        if (amounts.spot_adjustment > 0) {
            deploy(unwind, StrategyLeg::Spot, magnitude(amounts.spot_adjustment));
        }
        if (amounts.perp_adjustment > 0) {
            deploy(unwind, StrategyLeg::Perp, magnitude(amounts.perp_adjustment));
        }
        if (amounts.spot_adjustment != 0 || amounts.perp_adjustment != 0) {
            report_position(unwind, amounts.spot_adjustment, amounts.perp_adjustment);
        }

        new_delta = position_manager_->current_delta();
        emit(unwind, RebalanceEvent{old_delta, new_delta});
    } catch (...) {
        abort_operation("rebalance", unwind);
        throw;
    }
    unwind.commit();

    std::cout << "[Vault] Rebalance by " << caller << " spot_adj=" << amounts.spot_adjustment
              << " perp_adj=" << amounts.perp_adjustment << " delta " << old_delta
              << " -> " << new_delta << std::endl;
}

void VaultCore::sync_position(const Account& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_not_paused();
    if (!position_manager_) {
        throw VaultError(ErrorCode::PositionManagerNotSet, "no position manager to sync");
    }
    if (caller != position_manager_account_) {
        throw VaultError(ErrorCode::NotPositionManager, caller + " is not the position manager");
    }
    if (!strategies_set()) {
        throw VaultError(ErrorCode::StrategyNotSet, "spot and perp strategies must be set to sync");
    }

    const SignedAmount spot_change = checked_signed_sub(to_signed(spot_strategy_->total_assets()), reported_spot_);
    const SignedAmount perp_change = checked_signed_sub(to_signed(perp_strategy_->total_assets()), reported_perp_);
    if (spot_change == 0 && perp_change == 0) {
        return;
    }

    UnwindLog unwind;
    try {
        report_position(unwind, spot_change, perp_change);
    } catch (...) {
        abort_operation("sync", unwind);
        throw;
    }
    unwind.commit();

    std::cout << "[Vault] Position synced spot_change=" << spot_change
              << " perp_change=" << perp_change << std::endl;
}

// ---------------------------------------------------------------------------
// Administration
// ---------------------------------------------------------------------------

void VaultCore::set_spot_strategy(const Account& caller, std::shared_ptr<StrategyAdapter> strategy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    if (!strategy) {
        throw VaultError(ErrorCode::ZeroAddress, "spot strategy must not be null");
    }
    UnwindLog unwind;
    try {
        emit(unwind, StrategyUpdatedEvent{StrategyLeg::Spot, strategy->name()});
    } catch (...) {
        abort_operation("set spot strategy", unwind);
        throw;
    }
    unwind.commit();
    spot_strategy_ = std::move(strategy);
    std::cout << "[Vault] Spot strategy set to " << spot_strategy_->name() << std::endl;
}

void VaultCore::set_perp_strategy(const Account& caller, std::shared_ptr<StrategyAdapter> strategy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    if (!strategy) {
        throw VaultError(ErrorCode::ZeroAddress, "perp strategy must not be null");
    }
    UnwindLog unwind;
    try {
        emit(unwind, StrategyUpdatedEvent{StrategyLeg::Perp, strategy->name()});
    } catch (...) {
        abort_operation("set perp strategy", unwind);
        throw;
    }
    unwind.commit();
    perp_strategy_ = std::move(strategy);
    std::cout << "[Vault] Perp strategy set to " << perp_strategy_->name() << std::endl;
}

void VaultCore::set_position_manager(const Account& caller,
                                     std::shared_ptr<PositionManager> manager,
                                     Account manager_account) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    if (!manager) {
        throw VaultError(ErrorCode::ZeroAddress, "position manager must not be null");
    }
    require_account(manager_account, "position manager");

    UnwindLog unwind;
    try {
        emit(unwind, PositionManagerUpdatedEvent{manager_account});
    } catch (...) {
        abort_operation("set position manager", unwind);
        throw;
    }
    unwind.commit();
    position_manager_ = std::move(manager);
    position_manager_account_ = std::move(manager_account);
    // A new manager has seen none of the deployed capital yet.
    reported_spot_ = 0;
    reported_perp_ = 0;
    std::cout << "[Vault] Position manager set (" << position_manager_account_ << ")" << std::endl;
}

void VaultCore::emergency_pause(const Account& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    UnwindLog unwind;
    try {
        emit(unwind, EmergencyPauseEvent{true});
    } catch (...) {
        abort_operation("pause", unwind);
        throw;
    }
    unwind.commit();
    paused_ = true;
    std::cout << "[Vault] Emergency pause engaged by " << caller << std::endl;
}

void VaultCore::emergency_unpause(const Account& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    UnwindLog unwind;
    try {
        emit(unwind, EmergencyPauseEvent{false});
    } catch (...) {
        abort_operation("unpause", unwind);
        throw;
    }
    unwind.commit();
    paused_ = false;
    std::cout << "[Vault] Emergency pause lifted by " << caller << std::endl;
}

void VaultCore::transfer_ownership(const Account& caller, Account new_owner) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EntryGuard guard(entered_);
    require_owner(caller);
    require_account(new_owner, "new owner");
    UnwindLog unwind;
    try {
        emit(unwind, OwnershipTransferredEvent{params_.owner, new_owner});
    } catch (...) {
        abort_operation("ownership transfer", unwind);
        throw;
    }
    unwind.commit();
    std::cout << "[Vault] Ownership " << params_.owner << " -> " << new_owner << std::endl;
    params_.owner = std::move(new_owner);
}

void VaultCore::add_event_listener(EventListener listener) {
    add_undoable_event_listener([listener = std::move(listener)](const VaultEvent& event) {
        listener(event);
        return EventUndo{};
    });
}

void VaultCore::add_undoable_event_listener(UndoableEventListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

// ---------------------------------------------------------------------------
// Valuation and queries
// ---------------------------------------------------------------------------

Amount VaultCore::total_assets() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!strategies_set()) {
        return idle_assets_;
    }
    return checked_add(idle_assets_,
                       checked_add(spot_strategy_->total_assets(), perp_strategy_->total_assets()));
}

Amount VaultCore::preview_deposit(Amount assets) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Amount supply = ledger_.total_supply();
    if (supply == 0) {
        return assets;
    }
    const Amount total = total_assets();
    if (total == 0) {
        return assets;
    }
    return mul_div(assets, supply, total);
}

Amount VaultCore::preview_withdraw(Amount shares) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Amount supply = ledger_.total_supply();
    if (supply == 0) {
        return 0;
    }
    return mul_div(shares, total_assets(), supply);
}

SignedAmount VaultCore::current_delta() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return position_manager_ ? position_manager_->current_delta() : 0;
}

bool VaultCore::is_paused() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return paused_;
}

Amount VaultCore::shares_of(const Account& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ledger_.balance_of(owner);
}

Amount VaultCore::total_shares() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ledger_.total_supply();
}

Amount VaultCore::idle_assets() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return idle_assets_;
}

Amount VaultCore::share_price() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Amount supply = ledger_.total_supply();
    if (supply == 0) {
        return kPrecision;
    }
    return mul_div(total_assets(), kPrecision, supply);
}

Amount VaultCore::net_contributed() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return total_deposited_ > total_withdrawn_ ? total_deposited_ - total_withdrawn_ : 0;
}

Account VaultCore::owner() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return params_.owner;
}

bool VaultCore::has_position_manager() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return static_cast<bool>(position_manager_);
}

VaultSnapshot VaultCore::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    VaultSnapshot snap;
    snap.idle_assets = idle_assets_;
    snap.spot_assets = spot_strategy_ ? spot_strategy_->total_assets() : 0;
    snap.perp_assets = perp_strategy_ ? perp_strategy_->total_assets() : 0;
    snap.total_assets = total_assets();
    snap.total_shares = ledger_.total_supply();
    snap.share_price = share_price();
    snap.net_contributed = net_contributed();
    snap.delta = current_delta();
    snap.paused = paused_;
    snap.has_position_manager = static_cast<bool>(position_manager_);
    return snap;
}

InvariantReport VaultCore::check_invariants() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    InvariantReport report;

    WideAmount sum = 0;
    for (const auto& [owner, shares] : ledger_.balances()) {
        if (shares == 0) {
            report.violations.push_back("zero balance stored for " + owner);
        }
        sum += shares;
    }
    if (sum != ledger_.total_supply()) {
        report.violations.push_back("sum of share balances differs from total supply " +
                                    std::to_string(ledger_.total_supply()));
    }
    if ((ledger_.total_supply() == 0) != (ledger_.holder_count() == 0)) {
        report.violations.push_back("total supply and holder set disagree on emptiness");
    }
    if (ledger_.total_supply() != 0 && total_assets() == 0) {
        report.violations.push_back("shares outstanding against zero assets");
    }
    return report;
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

Amount VaultCore::calculate_shares(Amount assets) const {
    const Amount shares = preview_deposit(assets);
    if (shares == 0) {
        throw VaultError(ErrorCode::ZeroAmount,
                         "deposit of " + std::to_string(assets) + " assets mints zero shares");
    }
    return shares;
}

void VaultCore::require_owner(const Account& caller) const {
    if (caller != params_.owner) {
        throw VaultError(ErrorCode::NotOwner, caller + " is not the vault owner");
    }
}

void VaultCore::require_not_paused() const {
    if (paused_) {
        throw VaultError(ErrorCode::VaultPaused, "vault is paused");
    }
}

void VaultCore::deploy(UnwindLog& unwind, StrategyLeg leg, Amount amount) {
    if (amount == 0) {
        return;
    }
    const auto strategy = strategy_for(leg);
    debit_idle(unwind, amount);

    const Amount accepted = strategy->deposit(amount);
    if (accepted != 0) {
        const Amount held = std::min(accepted, amount);
        unwind.record(std::string("recall ") + to_string(leg) + " deposit", [strategy, held] {
            const Amount returned = strategy->withdraw(held);
            if (returned != held) {
                throw VaultError(ErrorCode::InsufficientBalance,
                                 strategy->name() + " returned " + std::to_string(returned) +
                                 " of " + std::to_string(held));
            }
        });
    }
    if (accepted != amount) {
        throw VaultError(ErrorCode::StrategyDepositFailed,
                         strategy->name() + " accepted " + std::to_string(accepted) +
                         " of " + std::to_string(amount));
    }
}

void VaultCore::recall(UnwindLog& unwind, StrategyLeg leg, Amount amount) {
    if (amount == 0) {
        return;
    }
    const auto strategy = strategy_for(leg);

    const Amount returned = strategy->withdraw(amount);
    if (returned != 0) {
        const Amount received = std::min(returned, amount);
        unwind.record(std::string("redeploy ") + to_string(leg) + " withdrawal", [strategy, received] {
            const Amount accepted = strategy->deposit(received);
            if (accepted != received) {
                throw VaultError(ErrorCode::StrategyDepositFailed,
                                 strategy->name() + " accepted " + std::to_string(accepted) +
                                 " of " + std::to_string(received));
            }
        });
    }
    if (returned != amount) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         strategy->name() + " returned " + std::to_string(returned) +
                         " of " + std::to_string(amount));
    }
    credit_idle(unwind, amount);
}

void VaultCore::report_position(UnwindLog& unwind, SignedAmount spot_change, SignedAmount perp_change) {
    // Everything that can overflow is computed before the manager is told.
    const SignedAmount spot_revert = checked_negate(spot_change);
    const SignedAmount perp_revert = checked_negate(perp_change);
    const SignedAmount spot_reported = checked_signed_add(reported_spot_, spot_change);
    const SignedAmount perp_reported = checked_signed_add(reported_perp_, perp_change);

    const auto manager = position_manager_;
    manager->update_position(spot_change, perp_change);
    unwind.record("revert position update", [manager, spot_revert, perp_revert] {
        manager->update_position(spot_revert, perp_revert);
    });

    const SignedAmount spot_before = reported_spot_;
    const SignedAmount perp_before = reported_perp_;
    reported_spot_ = spot_reported;
    reported_perp_ = perp_reported;
    unwind.record("restore reported position", [this, spot_before, perp_before] {
        reported_spot_ = spot_before;
        reported_perp_ = perp_before;
    });
}

void VaultCore::credit_idle(UnwindLog& unwind, Amount amount) {
    const Amount before = idle_assets_;
    idle_assets_ = checked_add(idle_assets_, amount);
    unwind.record("restore idle balance", [this, before] { idle_assets_ = before; });
}

void VaultCore::debit_idle(UnwindLog& unwind, Amount amount) {
    const Amount before = idle_assets_;
    idle_assets_ = checked_sub(idle_assets_, amount, "idle balance");
    unwind.record("restore idle balance", [this, before] { idle_assets_ = before; });
}

// A listener that throws aborts the operation; listeners that already took
// the event are asked to retract it during the rollback.
void VaultCore::emit(UnwindLog& unwind, const VaultEvent& event) {
    const auto listeners = listeners_;
    for (const auto& listener : listeners) {
        auto undo = listener(event);
        if (undo) {
            unwind.record(std::string("retract ") + event_type(event) + " event", std::move(undo));
        }
    }
}

void VaultCore::abort_operation(const char* operation, UnwindLog& unwind) {
    const std::string reason = describe_current_exception();
    const auto failures = unwind.rollback();
    if (failures.empty()) {
        std::cerr << "[Vault] " << operation << " aborted and rolled back: " << reason << std::endl;
        return;
    }

    std::string detail;
    for (const auto& failure : failures) {
        detail += "; " + failure;
    }
    std::cerr << "[Vault] " << operation << " rollback incomplete: " << reason << detail << std::endl;
    throw VaultError(ErrorCode::UnwindFailed,
                     std::string(operation) + " failed (" + reason + ") and could not be rolled back" + detail);
}

const std::shared_ptr<StrategyAdapter>& VaultCore::strategy_for(StrategyLeg leg) const {
    const auto& strategy = leg == StrategyLeg::Spot ? spot_strategy_ : perp_strategy_;
    if (!strategy) {
        throw VaultError(ErrorCode::StrategyNotSet, std::string(to_string(leg)) + " strategy not set");
    }
    return strategy;
}

bool VaultCore::strategies_set() const {
    return spot_strategy_ && perp_strategy_;
}

} // namespace vault
