#include "vault/vault_config.hpp"

#include "vault/util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace vault {
namespace {

[[noreturn]] void wrong_type(const std::string& key, const char* expected) {
    throw std::invalid_argument("Config key '" + key + "' must be " + expected);
}

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) {
        return;
    }
    if (!j.at(key).is_string()) {
        wrong_type(key, "a string");
    }
    out = j.at(key).get<std::string>();
}

void read_amount(const nlohmann::json& j, const std::string& key, Amount& out) {
    if (!j.contains(key)) {
        return;
    }
    if (!j.at(key).is_number_unsigned()) {
        wrong_type(key, "a non-negative integer");
    }
    out = j.at(key).get<Amount>();
}

void read_bps(const nlohmann::json& j, const char* key, std::uint32_t& out) {
    Amount value = out;
    read_amount(j, key, value);
    if (value > kBasisPointScale) {
        throw std::invalid_argument(std::string("Config key '") + key + "' exceeds " +
                                    std::to_string(kBasisPointScale) + " bps");
    }
    out = static_cast<std::uint32_t>(value);
}

void read_strategy(const nlohmann::json& j, const char* key, StrategyConfig& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& section = j.at(key);
    if (!section.is_object()) {
        wrong_type(key, "an object");
    }
    read_string(section, "name", out.name);
    read_amount(section, "capacity", out.capacity);
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

VaultConfig parse_vault_config(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Vault config must be a JSON object");
    }

    VaultConfig config;
    read_string(json, "owner", config.owner);
    read_amount(json, "min_deposit", config.min_deposit);
    read_bps(json, "max_delta_tolerance_bps", config.max_delta_tolerance_bps);
    read_string(json, "position_manager_account", config.position_manager_account);
    read_string(json, "journal_path", config.journal_path);
    read_strategy(json, "spot", config.spot);
    read_strategy(json, "perp", config.perp);

    if (json.contains("initial_balances")) {
        const auto& balances = json.at("initial_balances");
        if (!balances.is_object()) {
            wrong_type("initial_balances", "an object");
        }
        for (const auto& [account, amount] : balances.items()) {
            if (!amount.is_number_unsigned()) {
                wrong_type("initial_balances." + account, "a non-negative integer");
            }
            config.initial_balances[account] = amount.get<Amount>();
        }
    }

    if (config.owner.empty()) {
        throw std::invalid_argument("Config key 'owner' must not be empty");
    }
    if (config.min_deposit == 0) {
        throw std::invalid_argument("Config key 'min_deposit' must be positive");
    }
    return config;
}

VaultConfig load_vault_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.good()) {
        throw std::runtime_error("Failed to open vault config at " + path.string());
    }

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse vault config at " + path.string() + ": " + ex.what());
    }

    auto config = parse_vault_config(json);
    std::cout << "[Config] Loaded vault config from " << path.string() << std::endl;
    return config;
}

void apply_env_overrides(VaultConfig& config) {
    if (const char* owner = env_or_null("VAULT_OWNER")) {
        config.owner = owner;
    }
    if (const char* min_deposit = env_or_null("VAULT_MIN_DEPOSIT")) {
        const auto parsed = parse_amount(trim(min_deposit));
        if (!parsed || *parsed == 0) {
            throw std::invalid_argument(std::string("VAULT_MIN_DEPOSIT must be a positive integer, got '") +
                                        min_deposit + "'");
        }
        std::cout << "[Config] Minimum deposit overridden to " << *parsed << std::endl;
        config.min_deposit = *parsed;
    }
    if (const char* journal_path = env_or_null("VAULT_JOURNAL_PATH")) {
        config.journal_path = journal_path;
    }
    if (const char* journal_key = env_or_null("VAULT_JOURNAL_KEY")) {
        config.journal_key = journal_key;
    }
}

VaultParams to_vault_params(const VaultConfig& config) {
    return VaultParams{config.owner, config.min_deposit};
}

} // namespace vault
