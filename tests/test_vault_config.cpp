#include "vault/vault_config.hpp"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TEST_CASE("parse_vault_config keeps defaults for missing keys") {
    const auto config = vault::parse_vault_config(nlohmann::json::object());
    CHECK(config.owner == "owner");
    CHECK(config.min_deposit == vault::kMinDeposit);
    CHECK(config.max_delta_tolerance_bps == vault::kMaxDeltaToleranceBps);
    CHECK(config.spot.capacity == 0);
    CHECK(config.initial_balances.empty());
    CHECK(config.journal_key.empty());
}

TEST_CASE("parse_vault_config reads every section") {
    const auto json = nlohmann::json::parse(R"({
        "owner": "treasury",
        "min_deposit": 1000,
        "max_delta_tolerance_bps": 250,
        "position_manager_account": "keeper",
        "journal_path": "/tmp/journal.jsonl",
        "spot": {"name": "aave-usdc", "capacity": 5000000},
        "perp": {"name": "gmx-short"},
        "initial_balances": {"alice": 1000, "bob": 250}
    })");

    const auto config = vault::parse_vault_config(json);
    CHECK(config.owner == "treasury");
    CHECK(config.min_deposit == 1000);
    CHECK(config.max_delta_tolerance_bps == 250);
    CHECK(config.position_manager_account == "keeper");
    CHECK(config.journal_path == "/tmp/journal.jsonl");
    CHECK(config.spot.name == "aave-usdc");
    CHECK(config.spot.capacity == 5000000);
    CHECK(config.perp.name == "gmx-short");
    CHECK(config.perp.capacity == 0);
    CHECK(config.initial_balances.at("alice") == 1000);
    CHECK(config.initial_balances.at("bob") == 250);

    const auto params = vault::to_vault_params(config);
    CHECK(params.owner == "treasury");
    CHECK(params.min_deposit == 1000);
}

TEST_CASE("parse_vault_config rejects wrongly typed or invalid values") {
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"min_deposit": "ten"})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"min_deposit": -5})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"min_deposit": 0})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"owner": ""})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"max_delta_tolerance_bps": 10001})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"spot": 7})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse(R"({"initial_balances": {"alice": 1.5}})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(vault::parse_vault_config(nlohmann::json::parse("[]")), std::invalid_argument);
}

TEST_CASE("load_vault_config reads files and reports unreadable ones") {
    const auto dir = std::filesystem::temp_directory_path();
    const auto path = dir / "neutral_vault_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"owner": "file-owner", "min_deposit": 25})";
    }
    const auto config = vault::load_vault_config(path);
    CHECK(config.owner == "file-owner");
    CHECK(config.min_deposit == 25);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_THROWS_AS(vault::load_vault_config(path), std::runtime_error);

    std::filesystem::remove(path);
    CHECK_THROWS_AS(vault::load_vault_config(dir / "neutral_vault_missing.json"), std::runtime_error);
}

TEST_CASE("apply_env_overrides takes owner, dust floor and journal settings from the environment") {
    setenv("VAULT_OWNER", "env-owner", 1);
    setenv("VAULT_MIN_DEPOSIT", "500", 1);
    setenv("VAULT_JOURNAL_PATH", "/tmp/env-journal.jsonl", 1);
    setenv("VAULT_JOURNAL_KEY", "s3cret", 1);

    vault::VaultConfig config;
    vault::apply_env_overrides(config);
    CHECK(config.owner == "env-owner");
    CHECK(config.min_deposit == 500);
    CHECK(config.journal_path == "/tmp/env-journal.jsonl");
    CHECK(config.journal_key == "s3cret");

    setenv("VAULT_MIN_DEPOSIT", "lots", 1);
    vault::VaultConfig invalid;
    CHECK_THROWS_AS(vault::apply_env_overrides(invalid), std::invalid_argument);

    unsetenv("VAULT_OWNER");
    unsetenv("VAULT_MIN_DEPOSIT");
    unsetenv("VAULT_JOURNAL_PATH");
    unsetenv("VAULT_JOURNAL_KEY");
}
