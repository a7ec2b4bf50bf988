#include "vault/events.hpp"

namespace vault {
namespace {

struct TypeVisitor {
    std::string operator()(const DepositEvent&) const { return "Deposit"; }
    std::string operator()(const WithdrawEvent&) const { return "Withdraw"; }
    std::string operator()(const RebalanceEvent&) const { return "Rebalance"; }
    std::string operator()(const EmergencyPauseEvent&) const { return "EmergencyPause"; }
    std::string operator()(const SharesTransferredEvent&) const { return "SharesTransferred"; }
    std::string operator()(const StrategyUpdatedEvent&) const { return "StrategyUpdated"; }
    std::string operator()(const PositionManagerUpdatedEvent&) const { return "PositionManagerUpdated"; }
    std::string operator()(const OwnershipTransferredEvent&) const { return "OwnershipTransferred"; }
};

struct PayloadVisitor {
    nlohmann::json operator()(const DepositEvent& e) const {
        return {{"owner", e.owner}, {"assets", e.assets}, {"shares", e.shares}};
    }
    nlohmann::json operator()(const WithdrawEvent& e) const {
        return {{"owner", e.owner}, {"assets", e.assets}, {"shares", e.shares}};
    }
    nlohmann::json operator()(const RebalanceEvent& e) const {
        return {{"oldDelta", e.old_delta}, {"newDelta", e.new_delta}};
    }
    nlohmann::json operator()(const EmergencyPauseEvent& e) const {
        return {{"paused", e.paused}};
    }
    nlohmann::json operator()(const SharesTransferredEvent& e) const {
        return {{"from", e.from}, {"to", e.to}, {"shares", e.shares}};
    }
    nlohmann::json operator()(const StrategyUpdatedEvent& e) const {
        return {{"leg", to_string(e.leg)}, {"name", e.name}};
    }
    nlohmann::json operator()(const PositionManagerUpdatedEvent& e) const {
        return {{"managerAccount", e.manager_account}};
    }
    nlohmann::json operator()(const OwnershipTransferredEvent& e) const {
        return {{"previousOwner", e.previous_owner}, {"newOwner", e.new_owner}};
    }
};

} // namespace

std::string event_type(const VaultEvent& event) {
    return std::visit(TypeVisitor{}, event);
}

nlohmann::json event_payload(const VaultEvent& event) {
    return std::visit(PayloadVisitor{}, event);
}

} // namespace vault
