#include "vault/share_ledger.hpp"

#include "vault/errors.hpp"
#include "vault/math.hpp"

namespace vault {
namespace {

void require_account(const Account& account) {
    if (account.empty()) {
        throw VaultError(ErrorCode::ZeroAddress, "share account must not be empty");
    }
}

void require_shares(Amount shares) {
    if (shares == 0) {
        throw VaultError(ErrorCode::ZeroAmount, "share amount must be positive");
    }
}

} // namespace

void ShareLedger::mint(const Account& to, Amount shares) {
    require_account(to);
    require_shares(shares);

    const Amount supply = checked_add(total_supply_, shares);
    auto& balance = balances_[to];
    balance += shares;   // bounded by supply
    total_supply_ = supply;
}

void ShareLedger::burn(const Account& from, Amount shares) {
    require_account(from);
    require_shares(shares);

    const auto it = balances_.find(from);
    const Amount balance = it == balances_.end() ? 0 : it->second;
    const Amount remaining = checked_sub(balance, shares, "share balance");

    if (remaining == 0) {
        balances_.erase(it);
    } else {
        it->second = remaining;
    }
    total_supply_ -= shares;
}

void ShareLedger::transfer(const Account& from, const Account& to, Amount shares) {
    require_account(from);
    require_account(to);
    require_shares(shares);

    const auto it = balances_.find(from);
    const Amount balance = it == balances_.end() ? 0 : it->second;
    const Amount remaining = checked_sub(balance, shares, "share balance");
    if (from == to) {
        return;
    }

    if (remaining == 0) {
        balances_.erase(it);
    } else {
        it->second = remaining;
    }
    balances_[to] += shares;
}

Amount ShareLedger::balance_of(const Account& owner) const {
    const auto it = balances_.find(owner);
    return it == balances_.end() ? 0 : it->second;
}

} // namespace vault
