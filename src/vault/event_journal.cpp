#include "vault/event_journal.hpp"

#include "vault/errors.hpp"
#include "vault/math.hpp"
#include "vault/vault_core.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace vault {
namespace {

std::int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw std::runtime_error("Failed to compute journal HMAC");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }
    return oss.str();
}

Amount payload_amount(const nlohmann::json& payload, const char* key) {
    if (!payload.contains(key) || !payload.at(key).is_number_unsigned()) {
        throw std::runtime_error(std::string("Journal payload missing amount '") + key + "'");
    }
    return payload.at(key).get<Amount>();
}

Account payload_account(const nlohmann::json& payload, const char* key) {
    if (!payload.contains(key) || !payload.at(key).is_string()) {
        throw std::runtime_error(std::string("Journal payload missing account '") + key + "'");
    }
    return payload.at(key).get<Account>();
}

void debit(std::map<Account, Amount>& balances, const Account& account, Amount shares) {
    auto& balance = balances[account];
    balance = checked_sub(balance, shares, "replayed share balance");
    if (balance == 0) {
        balances.erase(account);
    }
}

} // namespace

EventJournal::EventJournal(EventJournalConfig config)
    : config_(std::move(config)) {
    if (config_.storage_path.empty()) {
        throw std::invalid_argument("EventJournal storage path not set");
    }
}

std::size_t EventJournal::load() {
    entries_.clear();

    ensure_directory();
    std::ifstream input(config_.storage_path);
    if (!input.good()) {
        return 0;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            const auto json = nlohmann::json::parse(line);
            JournalEntry entry;
            entry.sequence = json.at("seq").get<std::uint64_t>();
            entry.time_ms = json.at("time").get<std::int64_t>();
            entry.type = json.at("type").get<std::string>();
            entry.payload = json.at("payload");
            entry.digest = json.at("digest").get<std::string>();
            entries_.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& ex) {
            throw std::runtime_error("Malformed journal entry at " + config_.storage_path.string() +
                                     ":" + std::to_string(line_number) + ": " + ex.what());
        }
    }

    std::cout << "[Journal] Loaded " << entries_.size() << " entries from "
              << config_.storage_path.string() << std::endl;
    return entries_.size();
}

std::uint64_t EventJournal::append(const VaultEvent& event) {
    JournalEntry entry;
    entry.sequence = next_sequence();
    entry.time_ms = current_timestamp_ms();
    entry.type = event_type(event);
    entry.payload = event_payload(event);
    entry.digest = compute_digest(entries_.empty() ? std::string{} : entries_.back().digest, entry);

    persist_entry(entry);
    entries_.push_back(std::move(entry));
    return entries_.back().sequence;
}

void EventJournal::retract_last(std::uint64_t sequence) {
    if (entries_.empty() || entries_.back().sequence != sequence) {
        throw std::runtime_error("Journal entry " + std::to_string(sequence) + " is not the last entry");
    }

    const auto line_size = static_cast<std::uintmax_t>(serialize_entry(entries_.back()).size() + 1);
    const auto file_size = std::filesystem::file_size(config_.storage_path);
    if (file_size < line_size) {
        throw std::runtime_error("Event journal at " + config_.storage_path.string() +
                                 " is shorter than its last entry");
    }
    std::filesystem::resize_file(config_.storage_path, file_size - line_size);
    entries_.pop_back();

    std::cout << "[Journal] Retracted entry " << sequence << std::endl;
}

std::uint64_t EventJournal::next_sequence() const {
    return entries_.empty() ? 1 : entries_.back().sequence + 1;
}

void EventJournal::attach_to(VaultCore& vault) {
    vault.add_undoable_event_listener([this](const VaultEvent& event) -> VaultCore::EventUndo {
        const auto sequence = append(event);
        return [this, sequence] { retract_last(sequence); };
    });
}

std::optional<std::uint64_t> EventJournal::first_invalid_sequence() const {
    std::string previous;
    std::uint64_t expected_sequence = 1;
    for (const auto& entry : entries_) {
        if (entry.sequence != expected_sequence || compute_digest(previous, entry) != entry.digest) {
            return entry.sequence;
        }
        previous = entry.digest;
        ++expected_sequence;
    }
    return std::nullopt;
}

std::map<Account, Amount> EventJournal::replay_share_balances(std::uint64_t from_sequence) const {
    std::map<Account, Amount> balances;
    for (const auto& entry : entries_) {
        if (entry.sequence < from_sequence) {
            continue;
        }
        if (entry.type == "Deposit") {
            const auto owner = payload_account(entry.payload, "owner");
            balances[owner] = checked_add(balances[owner], payload_amount(entry.payload, "shares"));
        } else if (entry.type == "Withdraw") {
            debit(balances, payload_account(entry.payload, "owner"), payload_amount(entry.payload, "shares"));
        } else if (entry.type == "SharesTransferred") {
            const auto shares = payload_amount(entry.payload, "shares");
            const auto to = payload_account(entry.payload, "to");
            debit(balances, payload_account(entry.payload, "from"), shares);
            balances[to] = checked_add(balances[to], shares);
        }
    }
    return balances;
}

void EventJournal::ensure_directory() const {
    const auto dir = config_.storage_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

void EventJournal::persist_entry(const JournalEntry& entry) {
    ensure_directory();

    std::ofstream output(config_.storage_path, std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to append to event journal at " + config_.storage_path.string());
    }
    output << serialize_entry(entry) << '\n';
    if (!output.good()) {
        throw std::runtime_error("Failed to write event journal at " + config_.storage_path.string());
    }
}

std::string EventJournal::serialize_entry(const JournalEntry& entry) const {
    nlohmann::json json;
    json["seq"] = entry.sequence;
    json["time"] = entry.time_ms;
    json["type"] = entry.type;
    json["payload"] = entry.payload;
    json["digest"] = entry.digest;
    return json.dump();
}

std::string EventJournal::compute_digest(const std::string& previous_digest, const JournalEntry& entry) const {
    std::ostringstream message;
    message << previous_digest << '|' << entry.sequence << '|' << entry.time_ms << '|'
            << entry.type << '|' << entry.payload.dump();
    return hmac_sha256_hex(config_.signing_key, message.str());
}

} // namespace vault
