#include "sim/simulated_strategy.hpp"

#include "vault/math.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace sim {

SimulatedStrategy::SimulatedStrategy(std::string name, vault::Amount capacity)
    : name_(std::move(name)),
      capacity_(capacity) {
    if (name_.empty()) {
        throw std::invalid_argument("SimulatedStrategy name must not be empty");
    }
}

vault::Amount SimulatedStrategy::deposit(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    vault::Amount headroom = amount;
    if (capacity_ != 0) {
        headroom = capacity_ > balance_ ? capacity_ - balance_ : 0;
    }
    const vault::Amount accepted = std::min(amount, headroom);
    balance_ = vault::checked_add(balance_, accepted);
    if (accepted != amount) {
        std::cout << "[Sim] " << name_ << " at capacity, accepted " << accepted
                  << " of " << amount << std::endl;
    }
    return accepted;
}

vault::Amount SimulatedStrategy::withdraw(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    const vault::Amount available = balance_ - std::min(locked_, balance_);
    const vault::Amount returned = std::min(amount, available);
    balance_ -= returned;
    if (returned != amount) {
        std::cout << "[Sim] " << name_ << " liquidity short, returned " << returned
                  << " of " << amount << std::endl;
    }
    return returned;
}

vault::Amount SimulatedStrategy::total_assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_;
}

void SimulatedStrategy::accrue_yield(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ = vault::checked_add(balance_, amount);
    std::cout << "[Sim] " << name_ << " accrued " << amount << " (balance " << balance_ << ")" << std::endl;
}

void SimulatedStrategy::realize_loss(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > balance_) {
        throw std::invalid_argument(name_ + " loss " + std::to_string(amount) +
                                    " exceeds balance " + std::to_string(balance_));
    }
    balance_ -= amount;
    std::cout << "[Sim] " << name_ << " lost " << amount << " (balance " << balance_ << ")" << std::endl;
}

void SimulatedStrategy::lock_liquidity(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    locked_ = vault::checked_add(locked_, amount);
}

void SimulatedStrategy::unlock_liquidity(vault::Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > locked_) {
        throw std::invalid_argument(name_ + " cannot unlock more than is locked");
    }
    locked_ -= amount;
}

vault::Amount SimulatedStrategy::locked_liquidity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

} // namespace sim
