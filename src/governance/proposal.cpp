// PROPSHARE - Governance Proposal Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/governance/proposal.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace propshare {
namespace governance {

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Open: return "Open";
        case ProposalStatus::Approved: return "Approved";
        case ProposalStatus::Rejected: return "Rejected";
        case ProposalStatus::Executed: return "Executed";
        default: return "Unknown";
    }
}

const char* ProposalTypeToString(ProposalType type) {
    switch (type) {
        case ProposalType::Signal: return "Signal";
        case ProposalType::Operational: return "Operational";
        case ProposalType::Financial: return "Financial";
        default: return "Unknown";
    }
}

std::optional<ProposalType> ParseProposalType(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "signal") return ProposalType::Signal;
    if (lower == "operational") return ProposalType::Operational;
    if (lower == "financial") return ProposalType::Financial;
    return std::nullopt;
}

// ============================================================================
// Proposal Implementation
// ============================================================================

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal #" << id << " (" << ProposalTypeToString(type) << ")"
        << " on property " << propertyId
        << " by " << proposer
        << " [" << ProposalStatusToString(status) << "]"
        << " yes=" << yesVotes << " no=" << noVotes
        << ": " << description;
    return oss.str();
}

} // namespace governance
} // namespace propshare
