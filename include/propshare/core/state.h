// PROPSHARE - Shared Ledger State
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// LedgerState holds every map the engines operate on. One instance is
// created per ledger and injected into each engine as a shared handle.
//
// Locking: every public engine operation holds `mutex` for its whole
// duration. The helper methods below do NOT lock; callers must hold the
// mutex.

#ifndef PROPSHARE_CORE_STATE_H
#define PROPSHARE_CORE_STATE_H

#include <propshare/core/types.h>
#include <propshare/governance/proposal.h>
#include <propshare/marketplace/listing.h>
#include <propshare/registry/property.h>

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace propshare {

/// (property, holder) key used by the ownership and income maps
using HoldingKey = std::pair<PropertyId, HolderId>;

struct LedgerState {
    /// Guards everything below
    mutable std::mutex mutex;

    // Property registry
    std::map<PropertyId, registry::Property> properties;
    PropertyId nextPropertyId{1};

    // Ownership ledger; zero balances are erased
    std::map<HoldingKey, Amount> ownership;

    // Income
    std::map<PropertyId, Amount> totalDeposited;
    std::map<HoldingKey, Amount> unclaimedIncome;

    // Marketplace, insertion order
    std::vector<marketplace::Listing> listings;
    ListingId nextListingId{1};

    // Governance
    std::map<ProposalId, governance::Proposal> proposals;
    ProposalId nextProposalId{1};

    LedgerState() = default;

    // Non-copyable (mutex)
    LedgerState(const LedgerState&) = delete;
    LedgerState& operator=(const LedgerState&) = delete;

    // === Helpers (caller holds mutex) ===

    /// Find a property, nullptr if unknown
    registry::Property* FindProperty(PropertyId id);
    const registry::Property* FindProperty(PropertyId id) const;

    /// Balance of holder, 0 when absent
    Amount GetBalance(PropertyId propertyId, const HolderId& holder) const;

    /// Add to a balance
    void Credit(PropertyId propertyId, const HolderId& holder, Amount amount);

    /// Subtract from a balance, erasing it at zero
    /// @return false (and no change) if the balance is insufficient
    bool Debit(PropertyId propertyId, const HolderId& holder, Amount amount);

    /// Snapshot of positive balances for one property
    std::map<HolderId, Amount> GetHolders(PropertyId propertyId) const;

    /// Sum of all holder balances for one property
    Amount GetCirculating(PropertyId propertyId) const;

    /// Name of a property, empty if unknown
    std::string GetPropertyName(PropertyId id) const;
};

} // namespace propshare

#endif // PROPSHARE_CORE_STATE_H
