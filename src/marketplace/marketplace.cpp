// PROPSHARE - Share Marketplace Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/marketplace/marketplace.h>
#include <propshare/util/logging.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace propshare {
namespace marketplace {

// ============================================================================
// MarketplaceStats
// ============================================================================

std::string MarketplaceStats::ToString() const {
    std::ostringstream ss;
    ss << "MarketplaceStats {"
       << " listed: " << totalListed
       << ", purchases: " << totalPurchases
       << ", sharesTraded: " << sharesTraded
       << ", staleRejections: " << staleRejections
       << ", stalePurged: " << stalePurged
       << ", open: " << openListings
       << " }";
    return ss.str();
}

// ============================================================================
// Marketplace
// ============================================================================

Marketplace::Marketplace(std::shared_ptr<LedgerState> state, MarketplaceConfig config)
    : state_(std::move(state)), config_(config) {
    if (!state_) {
        throw std::invalid_argument("Marketplace requires state");
    }
}

LedgerError Marketplace::List(PropertyId propertyId, const HolderId& seller,
                              Amount amount, Amount pricePerShare) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    if (state_->GetBalance(propertyId, seller) < amount) {
        return LedgerError::InsufficientBalance;
    }
    if (!CheckedMultiply(amount, pricePerShare)) {
        LOG_INFO(util::LogCategory::MARKET) << "Listing of " << amount << " shares @ "
                                            << pricePerShare << " overflows total price";
        return LedgerError::PriceOverflow;
    }

    Listing listing;
    listing.id = state_->nextListingId++;
    listing.propertyId = propertyId;
    listing.seller = seller;
    listing.amount = amount;
    listing.pricePerShare = pricePerShare;
    state_->listings.push_back(listing);

    ++stats_.totalListed;

    LOG_DEBUG(util::LogCategory::MARKET) << "New " << listing.ToString();
    return LedgerError::OK;
}

PurchaseResult Marketplace::Buy(PropertyId propertyId, const HolderId& seller,
                                const HolderId& buyer, Amount amount) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    auto& listings = state_->listings;
    auto it = std::find_if(listings.begin(), listings.end(), [&](const Listing& l) {
        return l.propertyId == propertyId && l.seller == seller && l.amount >= amount;
    });
    if (it == listings.end()) {
        return PurchaseResult::Failure(LedgerError::NotFound);
    }

    auto total = CheckedMultiply(amount, it->pricePerShare);
    if (!total) {
        return PurchaseResult::Failure(LedgerError::PriceOverflow);
    }

    if (!state_->Debit(propertyId, seller, amount)) {
        ++stats_.staleRejections;
        LOG_WARN(util::LogCategory::MARKET) << "Seller " << seller << " no longer covers listing #"
                                            << it->id << " (" << amount << " requested)";
        if (config_.purgeStaleListings) {
            LOG_INFO(util::LogCategory::MARKET) << "Purging stale listing #" << it->id;
            listings.erase(it);
            ++stats_.stalePurged;
        }
        return PurchaseResult::Failure(LedgerError::InsufficientBalance);
    }
    state_->Credit(propertyId, buyer, amount);

    Amount price = it->pricePerShare;
    if (it->amount == amount) {
        listings.erase(it);
    } else {
        it->amount -= amount;
    }

    ++stats_.totalPurchases;
    stats_.sharesTraded += amount;

    LOG_DEBUG(util::LogCategory::MARKET) << buyer << " bought " << amount << " shares of property "
                                         << propertyId << " from " << seller << " @ " << price;
    return PurchaseResult::Success(price, *total);
}

std::vector<Listing> Marketplace::GetListings() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->listings;
}

std::vector<Listing> Marketplace::GetListingsForProperty(PropertyId propertyId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Listing> result;
    for (const auto& listing : state_->listings) {
        if (listing.propertyId == propertyId) {
            result.push_back(listing);
        }
    }
    return result;
}

MarketplaceStats Marketplace::GetStats() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    MarketplaceStats stats = stats_;
    stats.openListings = state_->listings.size();
    return stats;
}

} // namespace marketplace
} // namespace propshare
