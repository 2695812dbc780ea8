// PROPSHARE - Share Marketplace
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Peer-to-peer sell listings with first-match settlement. Listings are
// not escrowed; settlement re-checks the seller's live balance.

#ifndef PROPSHARE_MARKETPLACE_MARKETPLACE_H
#define PROPSHARE_MARKETPLACE_MARKETPLACE_H

#include <propshare/core/state.h>
#include <propshare/marketplace/listing.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace propshare {
namespace marketplace {

// ============================================================================
// Marketplace Statistics
// ============================================================================

struct MarketplaceStats {
    /// Listings created
    uint64_t totalListed{0};

    /// Successful purchases
    uint64_t totalPurchases{0};

    /// Shares moved by purchases
    Amount sharesTraded{0};

    /// Purchases rejected because the seller no longer held the shares
    uint64_t staleRejections{0};

    /// Stale listings removed (purge mode only)
    uint64_t stalePurged{0};

    /// Currently open listings
    uint64_t openListings{0};

    std::string ToString() const;
};

// ============================================================================
// Marketplace Configuration
// ============================================================================

struct MarketplaceConfig {
    /// Remove a listing whose seller fails the settlement balance check.
    /// Off by default: the listing stays and the purchase fails.
    bool purgeStaleListings{false};
};

// ============================================================================
// Purchase Result
// ============================================================================

struct PurchaseResult {
    LedgerError error{LedgerError::OK};

    /// Price per share of the matched listing
    Amount pricePerShare{0};

    /// amount * pricePerShare, for an external payment layer
    Amount totalPrice{0};

    bool IsOk() const { return error == LedgerError::OK; }

    static PurchaseResult Success(Amount price, Amount total) {
        return {LedgerError::OK, price, total};
    }

    static PurchaseResult Failure(LedgerError err) {
        return {err, 0, 0};
    }
};

// ============================================================================
// Marketplace
// ============================================================================

class Marketplace {
public:
    explicit Marketplace(std::shared_ptr<LedgerState> state, MarketplaceConfig config = {});

    /**
     * Post a sell listing. The balance check is advisory: the shares stay
     * with the seller and may be moved before a purchase.
     *
     * @return InsufficientBalance when the seller holds fewer than amount;
     *         PriceOverflow when amount * pricePerShare exceeds an Amount
     */
    LedgerError List(PropertyId propertyId, const HolderId& seller,
                     Amount amount, Amount pricePerShare);

    /**
     * Buy from the first listing, in insertion order, that matches
     * property and seller and offers at least amount shares.
     *
     * On success the shares move from seller to buyer and the listing is
     * removed (exact fill) or reduced (partial fill).
     *
     * @return NotFound when no listing matches; PriceOverflow when the
     *         total price does not fit; InsufficientBalance when the
     *         seller no longer holds amount shares
     */
    PurchaseResult Buy(PropertyId propertyId, const HolderId& seller,
                       const HolderId& buyer, Amount amount);

    /// All open listings in insertion order
    std::vector<Listing> GetListings() const;

    /// Open listings for one property in insertion order
    std::vector<Listing> GetListingsForProperty(PropertyId propertyId) const;

    MarketplaceStats GetStats() const;

    const MarketplaceConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<LedgerState> state_;
    MarketplaceConfig config_;

    /// Guarded by state_->mutex
    MarketplaceStats stats_;
};

} // namespace marketplace
} // namespace propshare

#endif // PROPSHARE_MARKETPLACE_MARKETPLACE_H
