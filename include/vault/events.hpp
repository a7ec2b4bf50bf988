#pragma once

#include "vault/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace vault {

struct DepositEvent {
    Account owner;
    Amount assets = 0;
    Amount shares = 0;
};

struct WithdrawEvent {
    Account owner;
    Amount assets = 0;
    Amount shares = 0;
};

struct RebalanceEvent {
    SignedAmount old_delta = 0;
    SignedAmount new_delta = 0;
};

struct EmergencyPauseEvent {
    bool paused = false;
};

struct SharesTransferredEvent {
    Account from;
    Account to;
    Amount shares = 0;
};

struct StrategyUpdatedEvent {
    StrategyLeg leg = StrategyLeg::Spot;
    std::string name;
};

struct PositionManagerUpdatedEvent {
    Account manager_account;
};

struct OwnershipTransferredEvent {
    Account previous_owner;
    Account new_owner;
};

using VaultEvent = std::variant<DepositEvent,
                                WithdrawEvent,
                                RebalanceEvent,
                                EmergencyPauseEvent,
                                SharesTransferredEvent,
                                StrategyUpdatedEvent,
                                PositionManagerUpdatedEvent,
                                OwnershipTransferredEvent>;

std::string event_type(const VaultEvent& event);

nlohmann::json event_payload(const VaultEvent& event);

} // namespace vault
