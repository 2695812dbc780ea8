// PROPSHARE - Ledger Auditor
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Read-only checks over the shared ledger state, plus a SHA-256 digest of
// the state for comparing two ledgers.

#ifndef PROPSHARE_AUDIT_AUDITOR_H
#define PROPSHARE_AUDIT_AUDITOR_H

#include <propshare/core/state.h>
#include <propshare/marketplace/listing.h>

#include <memory>
#include <string>
#include <vector>

namespace propshare {
namespace audit {

/// A property whose supply and balances disagree
struct ConservationViolation {
    PropertyId propertyId{INVALID_ID};
    Amount totalShares{0};
    Amount sharesAvailable{0};
    Amount circulating{0};

    std::string ToString() const;
};

/// A listing the seller can no longer cover
struct StaleListing {
    marketplace::Listing listing;
    Amount sellerBalance{0};
};

struct AuditReport {
    std::vector<ConservationViolation> violations;
    std::vector<StaleListing> staleListings;
    std::string stateHash;

    size_t propertiesChecked{0};

    /// True when every property conserves its shares
    bool IsConsistent() const { return violations.empty(); }

    std::string ToString() const;
};

class Auditor {
public:
    explicit Auditor(std::shared_ptr<const LedgerState> state);

    /// sharesAvailable + circulating == totalShares, for every property
    std::vector<ConservationViolation> CheckConservation() const;

    /// Listings whose seller balance dropped below the listed amount
    std::vector<StaleListing> FindStaleListings() const;

    /**
     * Hex SHA-256 over properties, balances, deposits, unclaimed income
     * and proposals in key order. Listings are excluded.
     *
     * @throws std::runtime_error if the digest cannot be computed
     */
    std::string GetStateHash() const;

    /// Run all checks in one consistent snapshot and log the outcome
    AuditReport Run() const;

private:
    std::vector<ConservationViolation> CheckConservationLocked() const;
    std::vector<StaleListing> FindStaleListingsLocked() const;
    std::string GetStateHashLocked() const;

    std::shared_ptr<const LedgerState> state_;
};

} // namespace audit
} // namespace propshare

#endif // PROPSHARE_AUDIT_AUDITOR_H
