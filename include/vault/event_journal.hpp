#pragma once

#include "vault/events.hpp"
#include "vault/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vault {

class VaultCore;

struct EventJournalConfig {
    std::filesystem::path storage_path;
    std::string signing_key;
};

struct JournalEntry {
    std::uint64_t sequence = 0;
    std::int64_t time_ms = 0;
    std::string type;
    nlohmann::json payload;
    std::string digest;   // hex HMAC-SHA256 chained over the previous digest
};

// Append-only JSON-lines record of vault events with an HMAC chain, so edits
// to or removal of earlier lines are detectable.
class EventJournal {
public:
    explicit EventJournal(EventJournalConfig config);

    // Reads an existing journal file. Returns the number of entries.
    std::size_t load();
    // Returns the sequence number given to the event.
    std::uint64_t append(const VaultEvent& event);

    // Removes the newest entry from memory and from the file. Only the last
    // entry can be retracted, so the chain stays intact.
    void retract_last(std::uint64_t sequence);

    // Registers this journal as an event listener; it must outlive the vault.
    // Entries for operations the vault rolls back are retracted.
    void attach_to(VaultCore& vault);

    // Sequence number of the first entry whose digest does not verify.
    [[nodiscard]] std::optional<std::uint64_t> first_invalid_sequence() const;

    // Share balances implied by Deposit, Withdraw and SharesTransferred
    // entries with a sequence number of at least `from_sequence`.
    [[nodiscard]] std::map<Account, Amount> replay_share_balances(std::uint64_t from_sequence = 1) const;

    [[nodiscard]] std::uint64_t next_sequence() const;

    [[nodiscard]] const std::vector<JournalEntry>& entries() const { return entries_; }
    [[nodiscard]] const std::filesystem::path& path() const { return config_.storage_path; }

private:
    void ensure_directory() const;
    void persist_entry(const JournalEntry& entry);
    std::string serialize_entry(const JournalEntry& entry) const;
    std::string compute_digest(const std::string& previous_digest, const JournalEntry& entry) const;

    EventJournalConfig config_;
    std::vector<JournalEntry> entries_;
};

} // namespace vault
