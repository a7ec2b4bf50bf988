#pragma once

#include <stdexcept>
#include <string>

namespace vault {

enum class ErrorCode {
    ZeroAmount,
    ZeroAddress,
    DepositTooSmall,
    StrategyNotSet,
    PositionManagerNotSet,
    InsufficientBalance,
    StrategyDepositFailed,
    VaultPaused,
    RebalanceNotNeeded,
    NotPositionManager,
    NotOwner,
    ReentrantCall,
    ArithmeticOverflow,
    UnwindFailed
};

const char* to_string(ErrorCode code) noexcept;

class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace vault
