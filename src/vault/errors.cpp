#include "vault/errors.hpp"

namespace vault {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ZeroAmount: return "ZeroAmount";
        case ErrorCode::ZeroAddress: return "ZeroAddress";
        case ErrorCode::DepositTooSmall: return "DepositTooSmall";
        case ErrorCode::StrategyNotSet: return "StrategyNotSet";
        case ErrorCode::PositionManagerNotSet: return "PositionManagerNotSet";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::StrategyDepositFailed: return "StrategyDepositFailed";
        case ErrorCode::VaultPaused: return "VaultPaused";
        case ErrorCode::RebalanceNotNeeded: return "RebalanceNotNeeded";
        case ErrorCode::NotPositionManager: return "NotPositionManager";
        case ErrorCode::NotOwner: return "NotOwner";
        case ErrorCode::ReentrantCall: return "ReentrantCall";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::UnwindFailed: return "UnwindFailed";
    }
    return "Unknown";
}

} // namespace vault
