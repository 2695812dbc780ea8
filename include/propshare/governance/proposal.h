// PROPSHARE - Governance Proposal
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Proposal record and lifecycle enums for share-weighted governance.

#ifndef PROPSHARE_GOVERNANCE_PROPOSAL_H
#define PROPSHARE_GOVERNANCE_PROPOSAL_H

#include <propshare/core/types.h>

#include <map>
#include <optional>
#include <string>

namespace propshare {
namespace governance {

/// Proposal lifecycle status
enum class ProposalStatus {
    /// Accepting votes
    Open,

    /// Majority reached; transient, replaced by Executed in the same step
    Approved,

    /// Majority not reached (ties included)
    Rejected,

    /// Approved and executed
    Executed
};

/// Convert status to string
const char* ProposalStatusToString(ProposalStatus status);

/// Proposal category, selects the execution handler
enum class ProposalType {
    /// Non-binding signal; no handler by default
    Signal,

    /// Operational decision about the property (maintenance, management)
    Operational,

    /// Financial decision (sale, refinancing, distribution policy)
    Financial
};

/// Convert proposal type to string
const char* ProposalTypeToString(ProposalType type);

/// Parse proposal type from string
std::optional<ProposalType> ParseProposalType(const std::string& str);

/**
 * A share-weighted proposal attached to one property.
 */
struct Proposal {
    ProposalId id{INVALID_ID};
    PropertyId propertyId{INVALID_ID};
    HolderId proposer;
    std::string description;
    ProposalType type{ProposalType::Signal};
    ProposalStatus status{ProposalStatus::Open};

    /// Share-weighted tallies
    Amount yesVotes{0};
    Amount noVotes{0};

    /// voter -> choice (true = yes); one entry per identity
    std::map<HolderId, bool> votes;

    /// Check if voting is still possible
    bool IsOpen() const { return status == ProposalStatus::Open; }

    /// Check if the proposal reached a terminal state
    bool IsFinal() const {
        return status == ProposalStatus::Executed || status == ProposalStatus::Rejected;
    }

    /// Check if voter has a recorded vote
    bool HasVoted(const HolderId& voter) const { return votes.count(voter) > 0; }

    /// Get total weight cast
    Amount GetTotalVotes() const { return yesVotes + noVotes; }

    /// Get human-readable description
    std::string ToString() const;
};

} // namespace governance
} // namespace propshare

#endif // PROPSHARE_GOVERNANCE_PROPOSAL_H
