// PROPSHARE - Marketplace Listing
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#ifndef PROPSHARE_MARKETPLACE_LISTING_H
#define PROPSHARE_MARKETPLACE_LISTING_H

#include <propshare/core/types.h>

#include <optional>
#include <string>

namespace propshare {
namespace marketplace {

/**
 * An open sell offer.
 *
 * The amount is not escrowed: the seller may move shares away after
 * listing, so settlement re-checks the live balance.
 */
struct Listing {
    ListingId id{INVALID_ID};
    PropertyId propertyId{INVALID_ID};
    HolderId seller;
    Amount amount{0};
    Amount pricePerShare{0};

    /// Price of the whole remaining lot, nullopt if it overflows
    std::optional<Amount> GetTotalPrice() const { return CheckedMultiply(amount, pricePerShare); }

    /// Get human-readable description
    std::string ToString() const;
};

} // namespace marketplace
} // namespace propshare

#endif // PROPSHARE_MARKETPLACE_LISTING_H
