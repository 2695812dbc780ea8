// PROPSHARE - Rental Income Distribution
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Splits each deposit across the current holders of a property in
// proportion to their balances:
//
//   entitlement += floor(amount * balance / totalShares)
//
// Shares still unissued earn nothing, and the rounding remainder of each
// deposit is not tracked.

#ifndef PROPSHARE_INCOME_DISTRIBUTION_H
#define PROPSHARE_INCOME_DISTRIBUTION_H

#include <propshare/core/state.h>

#include <memory>
#include <string>
#include <vector>

namespace propshare {
namespace income {

/// One line of a holder's rental income statement
struct RentalIncomeRecord {
    PropertyId propertyId{INVALID_ID};
    std::string propertyName;
    Amount income{0};
};

class IncomeDistributor {
public:
    explicit IncomeDistributor(std::shared_ptr<LedgerState> state);

    /**
     * Record a deposit and credit every current holder.
     *
     * @return NotFound for an unknown property or one with zero total shares
     */
    LedgerError Deposit(PropertyId propertyId, Amount amount);

    /**
     * Pay out and clear a holder's entitlement. Returns 0 when nothing is
     * owed, so repeated claims are harmless.
     */
    Amount Claim(PropertyId propertyId, const HolderId& holder);

    /// Current unclaimed entitlement (0 when none)
    Amount GetUnclaimed(PropertyId propertyId, const HolderId& holder) const;

    /// Cumulative deposits for a property
    Amount GetTotalDeposited(PropertyId propertyId) const;

    /// Every unclaimed entry of a holder, ordered by property id
    std::vector<RentalIncomeRecord> GetRentalIncomeStatement(const HolderId& holder) const;

private:
    std::shared_ptr<LedgerState> state_;
};

} // namespace income
} // namespace propshare

#endif // PROPSHARE_INCOME_DISTRIBUTION_H
