#pragma once

#include "vault/types.hpp"

#include <cstddef>
#include <map>

namespace vault {

// Fungible share balances. Accounts with a zero balance are not stored, so the
// supply is zero exactly when there are no holders.
class ShareLedger {
public:
    void mint(const Account& to, Amount shares);
    void burn(const Account& from, Amount shares);
    void transfer(const Account& from, const Account& to, Amount shares);

    [[nodiscard]] Amount balance_of(const Account& owner) const;
    [[nodiscard]] Amount total_supply() const { return total_supply_; }
    [[nodiscard]] std::size_t holder_count() const { return balances_.size(); }
    [[nodiscard]] const std::map<Account, Amount>& balances() const { return balances_; }

private:
    std::map<Account, Amount> balances_;
    Amount total_supply_ = 0;
};

} // namespace vault
