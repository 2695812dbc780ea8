// PROPSHARE - Share-Weighted Governance
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Holders of a property vote on proposals attached to it. A vote weighs
// the voter's balance at the moment it is cast; later transfers do not
// change recorded tallies.
//
// Lifecycle:
//   Open -> Executed   (yes > no)
//   Open -> Rejected   (yes <= no, ties included)

#ifndef PROPSHARE_GOVERNANCE_GOVERNANCE_H
#define PROPSHARE_GOVERNANCE_GOVERNANCE_H

#include <propshare/core/state.h>
#include <propshare/governance/proposal.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace propshare {
namespace governance {

class GovernanceEngine {
public:
    /// Invoked with a copy of each executed proposal of the registered type
    using ExecutionHandler = std::function<void(const Proposal&)>;

    explicit GovernanceEngine(std::shared_ptr<LedgerState> state);

    // === Proposals ===

    /**
     * Open a new proposal. The proposer need not hold shares and the
     * property is not checked.
     */
    Proposal Submit(PropertyId propertyId, const std::string& description,
                    const HolderId& proposer, ProposalType type = ProposalType::Signal);

    std::optional<Proposal> GetProposal(ProposalId id) const;

    /// Proposals of one property, ordered by id
    std::vector<Proposal> GetProposals(PropertyId propertyId) const;

    size_t GetProposalCount() const;

    // === Voting ===

    /**
     * Cast a share-weighted vote.
     *
     * @return NotVotable when the proposal is unknown or closed, the
     *         voter already voted, or the voter holds no shares
     */
    LedgerError Vote(ProposalId id, const HolderId& voter, bool approve);

    bool HasVoted(ProposalId id, const HolderId& voter) const;

    // === Execution ===

    /**
     * Close an open proposal. yes > no executes it (and runs the handler
     * for its type, if any); otherwise it is rejected.
     *
     * @return NotExecutable when the proposal is unknown or not open
     */
    LedgerError Execute(ProposalId id);

    /// Register (or clear, with an empty function) the handler for a type
    void SetExecutionHandler(ProposalType type, ExecutionHandler handler);

private:
    std::shared_ptr<LedgerState> state_;

    mutable std::mutex handlersMutex_;
    std::map<ProposalType, ExecutionHandler> handlers_;
};

} // namespace governance
} // namespace propshare

#endif // PROPSHARE_GOVERNANCE_GOVERNANCE_H
