// PROPSHARE - Share-Weighted Governance Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/governance/governance.h>
#include <propshare/util/logging.h>

#include <stdexcept>

namespace propshare {
namespace governance {

GovernanceEngine::GovernanceEngine(std::shared_ptr<LedgerState> state)
    : state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("GovernanceEngine requires state");
    }
}

// ============================================================================
// Proposals
// ============================================================================

Proposal GovernanceEngine::Submit(PropertyId propertyId, const std::string& description,
                                  const HolderId& proposer, ProposalType type) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    Proposal proposal;
    proposal.id = state_->nextProposalId++;
    proposal.propertyId = propertyId;
    proposal.proposer = proposer;
    proposal.description = description;
    proposal.type = type;
    proposal.status = ProposalStatus::Open;

    state_->proposals[proposal.id] = proposal;

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Submitted " << proposal.ToString();
    return proposal;
}

std::optional<Proposal> GovernanceEngine::GetProposal(ProposalId id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->proposals.find(id);
    if (it == state_->proposals.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Proposal> GovernanceEngine::GetProposals(PropertyId propertyId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : state_->proposals) {
        if (proposal.propertyId == propertyId) {
            result.push_back(proposal);
        }
    }
    return result;
}

size_t GovernanceEngine::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->proposals.size();
}

// ============================================================================
// Voting
// ============================================================================

LedgerError GovernanceEngine::Vote(ProposalId id, const HolderId& voter, bool approve) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    auto it = state_->proposals.find(id);
    if (it == state_->proposals.end()) {
        return LedgerError::NotVotable;
    }
    Proposal& proposal = it->second;

    if (!proposal.IsOpen() || proposal.HasVoted(voter)) {
        return LedgerError::NotVotable;
    }

    Amount weight = state_->GetBalance(proposal.propertyId, voter);
    if (weight == 0) {
        return LedgerError::NotVotable;
    }

    proposal.votes[voter] = approve;
    if (approve) {
        proposal.yesVotes += weight;
    } else {
        proposal.noVotes += weight;
    }

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << voter << " voted " << (approve ? "yes" : "no")
                                             << " with weight " << weight
                                             << " on proposal " << id;
    return LedgerError::OK;
}

bool GovernanceEngine::HasVoted(ProposalId id, const HolderId& voter) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->proposals.find(id);
    return it != state_->proposals.end() && it->second.HasVoted(voter);
}

// ============================================================================
// Execution
// ============================================================================

LedgerError GovernanceEngine::Execute(ProposalId id) {
    Proposal executed;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);

        auto it = state_->proposals.find(id);
        if (it == state_->proposals.end() || !it->second.IsOpen()) {
            return LedgerError::NotExecutable;
        }
        Proposal& proposal = it->second;

        if (proposal.yesVotes <= proposal.noVotes) {
            proposal.status = ProposalStatus::Rejected;
            LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Proposal " << id << " rejected ("
                                                     << proposal.yesVotes << " yes, "
                                                     << proposal.noVotes << " no)";
            return LedgerError::OK;
        }

        // Approved resolves to Executed within the same step
        proposal.status = ProposalStatus::Executed;
        executed = proposal;
    }

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Proposal " << id << " executed ("
                                             << executed.yesVotes << " yes, "
                                             << executed.noVotes << " no)";

    ExecutionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(executed.type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (handler) {
        handler(executed);
    }
    return LedgerError::OK;
}

void GovernanceEngine::SetExecutionHandler(ProposalType type, ExecutionHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    if (handler) {
        handlers_[type] = std::move(handler);
    } else {
        handlers_.erase(type);
    }
}

} // namespace governance
} // namespace propshare
