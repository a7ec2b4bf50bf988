#include "sim/delta_neutral_position_manager.hpp"
#include "sim/in_memory_asset.hpp"
#include "sim/simulated_strategy.hpp"
#include "vault/errors.hpp"
#include "vault/event_journal.hpp"
#include "vault/util.hpp"
#include "vault/vault_config.hpp"
#include "vault/vault_core.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Session {
    vault::VaultConfig config;
    std::shared_ptr<sim::InMemoryAsset> asset;
    std::shared_ptr<sim::SimulatedStrategy> spot;
    std::shared_ptr<sim::SimulatedStrategy> perp;
    std::shared_ptr<sim::DeltaNeutralPositionManager> manager;
    std::unique_ptr<vault::EventJournal> journal;
    std::uint64_t first_session_sequence = 1;
    std::unique_ptr<vault::VaultCore> vault;   // destroyed before the journal it reports to
};

vault::VaultConfig load_config(int argc, char* argv[]) {
    std::string path;
    if (argc > 1 && std::string(argv[1]) != "-") {
        path = argv[1];
    } else if (const char* env_path = std::getenv("VAULT_CONFIG")) {
        path = env_path;
    }

    vault::VaultConfig config;
    if (!path.empty()) {
        config = vault::load_vault_config(path);
    } else {
        std::cout << "[Config] No config file given; using defaults" << std::endl;
    }
    vault::apply_env_overrides(config);
    return config;
}

void build_session(Session& session) {
    const auto& config = session.config;

    session.asset = std::make_shared<sim::InMemoryAsset>();
    for (const auto& [account, amount] : config.initial_balances) {
        session.asset->mint(account, amount);
    }
    session.spot = std::make_shared<sim::SimulatedStrategy>(config.spot.name, config.spot.capacity);
    session.perp = std::make_shared<sim::SimulatedStrategy>(config.perp.name, config.perp.capacity);
    session.manager = std::make_shared<sim::DeltaNeutralPositionManager>(
        session.spot, session.perp, config.max_delta_tolerance_bps);

    session.journal = std::make_unique<vault::EventJournal>(
        vault::EventJournalConfig{config.journal_path, config.journal_key});
    session.journal->load();
    if (const auto bad = session.journal->first_invalid_sequence()) {
        std::cerr << "[Journal] Existing journal fails verification at entry " << *bad << std::endl;
    }
    session.first_session_sequence = session.journal->next_sequence();

    session.vault = std::make_unique<vault::VaultCore>(vault::to_vault_params(config), session.asset);
    session.journal->attach_to(*session.vault);
    session.vault->set_spot_strategy(config.owner, session.spot);
    session.vault->set_perp_strategy(config.owner, session.perp);
    session.vault->set_position_manager(config.owner, session.manager, config.position_manager_account);
}

vault::Amount require_amount(const std::vector<std::string>& words, std::size_t index) {
    if (words.size() <= index) {
        throw std::invalid_argument("missing amount");
    }
    const auto amount = vault::parse_amount(words[index]);
    if (!amount) {
        throw std::invalid_argument("invalid amount '" + words[index] + "'");
    }
    return *amount;
}

const std::string& require_word(const std::vector<std::string>& words, std::size_t index, const char* what) {
    if (words.size() <= index) {
        throw std::invalid_argument(std::string("missing ") + what);
    }
    return words[index];
}

sim::SimulatedStrategy& require_leg(Session& session, const std::string& name) {
    const auto leg = vault::to_lower_copy(name);
    if (leg == "spot") {
        return *session.spot;
    }
    if (leg == "perp") {
        return *session.perp;
    }
    throw std::invalid_argument("unknown leg '" + name + "' (expected spot or perp)");
}

void print_status(const Session& session) {
    const auto snap = session.vault->snapshot();
    std::cout << "[Vault] Status"
              << " total_assets=" << snap.total_assets
              << " idle=" << snap.idle_assets
              << " spot=" << snap.spot_assets
              << " perp=" << snap.perp_assets
              << " shares=" << snap.total_shares
              << " price=" << std::fixed << std::setprecision(6)
              << static_cast<double>(snap.share_price) / static_cast<double>(vault::kPrecision)
              << std::defaultfloat
              << " delta=" << snap.delta
              << " paused=" << (snap.paused ? "yes" : "no") << std::endl;
}

void print_audit(const Session& session) {
    const auto report = session.vault->check_invariants();
    if (report.ok()) {
        std::cout << "[Audit] Ledger invariants hold" << std::endl;
    }
    for (const auto& violation : report.violations) {
        std::cerr << "[Audit] Violation: " << violation << std::endl;
    }

    if (const auto bad = session.journal->first_invalid_sequence()) {
        std::cerr << "[Audit] Journal chain broken at entry " << *bad << std::endl;
    } else {
        std::cout << "[Audit] Journal chain verified (" << session.journal->entries().size()
                  << " entries)" << std::endl;
    }

    const auto replayed = session.journal->replay_share_balances(session.first_session_sequence);
    std::size_t mismatches = 0;
    for (const auto& [account, shares] : replayed) {
        if (session.vault->shares_of(account) != shares) {
            ++mismatches;
            std::cerr << "[Audit] " << account << " journal=" << shares
                      << " ledger=" << session.vault->shares_of(account) << std::endl;
        }
    }
    vault::Amount replayed_total = 0;
    for (const auto& [account, shares] : replayed) {
        replayed_total += shares;
    }
    if (replayed_total != session.vault->total_shares()) {
        ++mismatches;
        std::cerr << "[Audit] journal supply " << replayed_total << " != ledger supply "
                  << session.vault->total_shares() << std::endl;
    }
    if (mismatches == 0) {
        std::cout << "[Audit] Journal replay matches share ledger" << std::endl;
    }

    const auto custody = session.asset->custody_balance();
    const auto managed = session.vault->total_assets();
    std::cout << "[Audit] custody=" << custody << " managed=" << managed
              << (custody == managed ? " (reconciled)" : " (MISMATCH)") << std::endl;
}

void print_help() {
    std::cout << "Commands:\n"
              << "  mint <account> <amount>          credit base tokens to an account\n"
              << "  deposit <account> <amount>\n"
              << "  withdraw <account> <shares>\n"
              << "  transfer <from> <to> <shares>\n"
              << "  yield <spot|perp> <amount>\n"
              << "  loss <spot|perp> <amount>\n"
              << "  rebalance [caller]\n"
              << "  sync\n"
              << "  pause | unpause\n"
              << "  status | balance <account> | audit\n"
              << "  help | quit" << std::endl;
}

// Returns false when the session should end.
bool execute(Session& session, const std::vector<std::string>& words) {
    const auto command = vault::to_lower_copy(words.front());
    const auto& owner = session.config.owner;
    auto& vault = *session.vault;

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "help") {
        print_help();
    } else if (command == "mint") {
        session.asset->mint(require_word(words, 1, "account"), require_amount(words, 2));
    } else if (command == "deposit") {
        vault.deposit(require_word(words, 1, "account"), require_amount(words, 2));
    } else if (command == "withdraw") {
        vault.withdraw(require_word(words, 1, "account"), require_amount(words, 2));
    } else if (command == "transfer") {
        vault.transfer_shares(require_word(words, 1, "sender"), require_word(words, 2, "recipient"),
                              require_amount(words, 3));
    } else if (command == "yield") {
        const auto amount = require_amount(words, 2);
        require_leg(session, require_word(words, 1, "leg")).accrue_yield(amount);
        session.asset->credit_custody(amount);
    } else if (command == "loss") {
        const auto amount = require_amount(words, 2);
        require_leg(session, require_word(words, 1, "leg")).realize_loss(amount);
        session.asset->debit_custody(amount);
    } else if (command == "rebalance") {
        vault.rebalance(words.size() > 1 ? words[1] : owner);
    } else if (command == "sync") {
        vault.sync_position(session.config.position_manager_account);
    } else if (command == "pause") {
        vault.emergency_pause(owner);
    } else if (command == "unpause") {
        vault.emergency_unpause(owner);
    } else if (command == "status") {
        print_status(session);
    } else if (command == "balance") {
        const auto& account = require_word(words, 1, "account");
        const auto shares = vault.shares_of(account);
        std::cout << "[Vault] " << account << " shares=" << shares
                  << " redeemable=" << vault.preview_withdraw(shares)
                  << " tokens=" << session.asset->balance_of(account) << std::endl;
    } else if (command == "audit") {
        print_audit(session);
    } else {
        std::cerr << "Unknown command '" << words.front() << "' (try help)" << std::endl;
    }
    return true;
}

void run(Session& session, std::istream& input, bool interactive) {
    std::string line;
    while (true) {
        if (interactive) {
            std::cout << "vault> " << std::flush;
        }
        if (!std::getline(input, line)) {
            break;
        }
        line = vault::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto words = vault::split_words(line);
        try {
            if (!execute(session, words)) {
                break;
            }
        } catch (const vault::VaultError& ex) {
            std::cerr << "[Vault] " << words.front() << " failed: " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "[Vault] " << words.front() << " failed: " << ex.what() << std::endl;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    vault::load_env_file(".env");

    Session session;
    try {
        session.config = load_config(argc, argv);
        build_session(session);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] Startup failed: " << ex.what() << std::endl;
        return 1;
    }

    if (argc > 2) {
        std::ifstream script(argv[2]);
        if (!script.is_open()) {
            std::cerr << "Failed to open script " << argv[2] << std::endl;
            return 1;
        }
        run(session, script, false);
    } else {
        run(session, std::cin, true);
    }

    print_status(session);
    return 0;
}
