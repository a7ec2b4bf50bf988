#pragma once

#include "vault/types.hpp"
#include "vault/vault_core.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace vault {

struct StrategyConfig {
    std::string name;
    Amount capacity = 0;   // 0 = unlimited
};

struct VaultConfig {
    std::string owner = "owner";
    Amount min_deposit = kMinDeposit;
    std::uint32_t max_delta_tolerance_bps = kMaxDeltaToleranceBps;
    std::string position_manager_account = "position-manager";
    std::string journal_path = "data/vault_journal.jsonl";
    std::string journal_key;   // environment only (VAULT_JOURNAL_KEY)
    StrategyConfig spot{"spot-lending", 0};
    StrategyConfig perp{"perp-hedge", 0};
    std::map<std::string, Amount> initial_balances;
};

// Missing keys keep their defaults; a key of the wrong type throws
// std::invalid_argument naming it.
VaultConfig parse_vault_config(const nlohmann::json& json);

// Throws std::runtime_error when the file cannot be read or parsed.
VaultConfig load_vault_config(const std::filesystem::path& path);

// VAULT_OWNER, VAULT_MIN_DEPOSIT, VAULT_JOURNAL_PATH, VAULT_JOURNAL_KEY.
void apply_env_overrides(VaultConfig& config);

VaultParams to_vault_params(const VaultConfig& config);

} // namespace vault
