#pragma once

#include "vault/types.hpp"

namespace vault {

// Transfer primitives of the base token between holders and vault custody.
// Both calls either move the full amount or throw.
class BaseAsset {
public:
    virtual ~BaseAsset() = default;

    virtual void transfer_in(const Account& from, Amount amount) = 0;
    virtual void transfer_out(const Account& to, Amount amount) = 0;
};

} // namespace vault
