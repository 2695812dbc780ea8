// PROPSHARE - Ownership Ledger
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Per-property share balances. For every property:
//
//   sharesAvailable + sum(balances) == totalShares
//
// Issuance moves shares from the property's available supply to a holder;
// transfers move them between holders.

#ifndef PROPSHARE_LEDGER_OWNERSHIP_H
#define PROPSHARE_LEDGER_OWNERSHIP_H

#include <propshare/core/state.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace propshare {
namespace ledger {

/// One line of a holder's ownership statement
struct OwnershipRecord {
    PropertyId propertyId{INVALID_ID};
    std::string propertyName;
    Amount shares{0};
};

class OwnershipLedger {
public:
    explicit OwnershipLedger(std::shared_ptr<LedgerState> state);

    /**
     * Issue shares from a property's available supply.
     *
     * @return NotFound for an unknown property, InsufficientSupply when
     *         amount exceeds sharesAvailable
     */
    LedgerError Issue(PropertyId propertyId, const HolderId& to, Amount amount);

    /**
     * Move shares between holders. A transfer to oneself is a successful
     * no-op once the balance check passes.
     *
     * @return InsufficientBalance when from holds fewer than amount
     */
    LedgerError Transfer(PropertyId propertyId, const HolderId& from,
                         const HolderId& to, Amount amount);

    /// Balance of holder (0 when absent)
    Amount GetBalance(PropertyId propertyId, const HolderId& holder) const;

    /// Snapshot of positive balances for one property
    std::map<HolderId, Amount> GetHolders(PropertyId propertyId) const;

    /// Sum of all holder balances for one property
    Amount GetCirculatingShares(PropertyId propertyId) const;

    /// All positive holdings of one holder, ordered by property id
    std::vector<OwnershipRecord> GetOwnershipStatement(const HolderId& holder) const;

private:
    std::shared_ptr<LedgerState> state_;
};

} // namespace ledger
} // namespace propshare

#endif // PROPSHARE_LEDGER_OWNERSHIP_H
