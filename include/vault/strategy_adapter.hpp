#pragma once

#include "vault/types.hpp"

#include <string>

namespace vault {

// A pluggable leg holding part of the vault's base asset. The vault verifies
// every reported amount against what it asked for.
class StrategyAdapter {
public:
    virtual ~StrategyAdapter() = default;

    // Returns the amount accepted. Anything other than `amount` fails the
    // caller's operation.
    virtual Amount deposit(Amount amount) = 0;

    // Returns the amount handed back to the vault.
    virtual Amount withdraw(Amount amount) = 0;

    // Live balance including accrued yield.
    [[nodiscard]] virtual Amount total_assets() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace vault
