#pragma once

#include <cstdint>
#include <string>

namespace vault {

using Amount = std::uint64_t;        // base-asset units and share units
using SignedAmount = std::int64_t;   // delta and per-leg adjustments
using Account = std::string;         // empty account is the null reference
using WideAmount = unsigned __int128;

constexpr Amount kMinDeposit = 10;
constexpr Amount kPrecision = 1'000'000'000'000'000'000ULL;
constexpr std::uint32_t kMaxDeltaToleranceBps = 100;   // 1%
constexpr std::uint32_t kBasisPointScale = 10000;

enum class StrategyLeg { Spot, Perp };

inline const char* to_string(StrategyLeg leg) {
    return leg == StrategyLeg::Spot ? "spot" : "perp";
}

} // namespace vault
