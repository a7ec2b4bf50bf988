#pragma once

#include "vault/base_asset.hpp"

#include <map>
#include <mutex>

namespace sim {

// Base token with per-account balances and a single vault custody balance.
class InMemoryAsset : public vault::BaseAsset {
public:
    void transfer_in(const vault::Account& from, vault::Amount amount) override;
    void transfer_out(const vault::Account& to, vault::Amount amount) override;

    void mint(const vault::Account& to, vault::Amount amount);

    // Yield or loss realized by a strategy outside of vault transfers.
    void credit_custody(vault::Amount amount);
    void debit_custody(vault::Amount amount);

    [[nodiscard]] vault::Amount balance_of(const vault::Account& account) const;
    [[nodiscard]] vault::Amount custody_balance() const;
    [[nodiscard]] vault::Amount total_supply() const;

private:
    mutable std::mutex mutex_;
    std::map<vault::Account, vault::Amount> balances_;
    vault::Amount custody_ = 0;
};

} // namespace sim
