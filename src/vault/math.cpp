#include "vault/math.hpp"

#include "vault/errors.hpp"

#include <limits>
#include <string>

namespace vault {

Amount mul_div(Amount a, Amount b, Amount d) {
    if (d == 0) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "division by zero");
    }
    const WideAmount quotient = static_cast<WideAmount>(a) * static_cast<WideAmount>(b) / d;
    if (quotient > std::numeric_limits<Amount>::max()) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "mul_div result exceeds 64 bits");
    }
    return static_cast<Amount>(quotient);
}

Amount checked_add(Amount lhs, Amount rhs) {
    if (lhs > std::numeric_limits<Amount>::max() - rhs) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "amount addition overflow");
    }
    return lhs + rhs;
}

Amount checked_sub(Amount lhs, Amount rhs, const char* what) {
    if (rhs > lhs) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         std::string(what) + " " + std::to_string(lhs) + " < " + std::to_string(rhs));
    }
    return lhs - rhs;
}

SignedAmount to_signed(Amount value) {
    if (value > static_cast<Amount>(std::numeric_limits<SignedAmount>::max())) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "amount does not fit a signed amount");
    }
    return static_cast<SignedAmount>(value);
}

Amount magnitude(SignedAmount value) noexcept {
    if (value >= 0) {
        return static_cast<Amount>(value);
    }
    return static_cast<Amount>(-(value + 1)) + 1;
}

SignedAmount negate(Amount value) {
    return -to_signed(value);
}

SignedAmount checked_signed_add(SignedAmount lhs, SignedAmount rhs) {
    if ((rhs > 0 && lhs > std::numeric_limits<SignedAmount>::max() - rhs) ||
        (rhs < 0 && lhs < std::numeric_limits<SignedAmount>::min() - rhs)) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "signed amount addition overflow");
    }
    return lhs + rhs;
}

SignedAmount checked_signed_sub(SignedAmount lhs, SignedAmount rhs) {
    if ((rhs < 0 && lhs > std::numeric_limits<SignedAmount>::max() + rhs) ||
        (rhs > 0 && lhs < std::numeric_limits<SignedAmount>::min() + rhs)) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "signed amount subtraction overflow");
    }
    return lhs - rhs;
}

SignedAmount checked_negate(SignedAmount value) {
    if (value == std::numeric_limits<SignedAmount>::min()) {
        throw VaultError(ErrorCode::ArithmeticOverflow, "signed amount has no negation");
    }
    return -value;
}

} // namespace vault
