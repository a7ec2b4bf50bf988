#include "sim/in_memory_asset.hpp"

#include "vault/math.hpp"

#include <stdexcept>
#include <string>

namespace sim {

void InMemoryAsset::transfer_in(const vault::Account& from, vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        return;
    }
    const auto it = balances_.find(from);
    const vault::Amount balance = it == balances_.end() ? 0 : it->second;
    if (balance < amount) {
        throw std::runtime_error("token balance of " + from + " is " + std::to_string(balance) +
                                 ", transfer needs " + std::to_string(amount));
    }
    custody_ = vault::checked_add(custody_, amount);
    it->second -= amount;
}

void InMemoryAsset::transfer_out(const vault::Account& to, vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (custody_ < amount) {
        throw std::runtime_error("vault custody " + std::to_string(custody_) +
                                 " cannot pay " + std::to_string(amount));
    }
    auto& balance = balances_[to];
    balance = vault::checked_add(balance, amount);
    custody_ -= amount;
}

void InMemoryAsset::mint(const vault::Account& to, vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& balance = balances_[to];
    balance = vault::checked_add(balance, amount);
}

void InMemoryAsset::credit_custody(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    custody_ = vault::checked_add(custody_, amount);
}

void InMemoryAsset::debit_custody(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    custody_ = vault::checked_sub(custody_, amount, "vault custody");
}

vault::Amount InMemoryAsset::balance_of(const vault::Account& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

vault::Amount InMemoryAsset::custody_balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custody_;
}

vault::Amount InMemoryAsset::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    vault::Amount total = custody_;
    for (const auto& [account, balance] : balances_) {
        total = vault::checked_add(total, balance);
    }
    return total;
}

} // namespace sim
