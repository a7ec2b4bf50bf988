#pragma once

#include "vault/types.hpp"

namespace vault {

// floor(a * b / d) with a 128-bit intermediate. Throws ArithmeticOverflow when
// d is zero or the quotient does not fit in an Amount.
Amount mul_div(Amount a, Amount b, Amount d);

Amount checked_add(Amount lhs, Amount rhs);

// Throws InsufficientBalance when rhs exceeds lhs; `what` names the balance.
Amount checked_sub(Amount lhs, Amount rhs, const char* what);

SignedAmount to_signed(Amount value);

// |value| as an Amount; well defined for the most negative SignedAmount.
Amount magnitude(SignedAmount value) noexcept;

SignedAmount negate(Amount value);

// Signed counterparts of checked_add; throw ArithmeticOverflow outside the
// SignedAmount range.
SignedAmount checked_signed_add(SignedAmount lhs, SignedAmount rhs);
SignedAmount checked_signed_sub(SignedAmount lhs, SignedAmount rhs);
SignedAmount checked_negate(SignedAmount value);

} // namespace vault
