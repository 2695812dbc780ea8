// PROPSHARE - Marketplace Tests
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <gtest/gtest.h>
#include <propshare/ledger/ownership.h>
#include <propshare/marketplace/marketplace.h>
#include <propshare/registry/registry.h>

#include <limits>
#include <memory>

using namespace propshare;
using namespace propshare::marketplace;

// ============================================================================
// Test Fixture
// ============================================================================

class MarketplaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        CreateMarket(MarketplaceConfig{});
    }

    void CreateMarket(MarketplaceConfig config) {
        state_ = std::make_shared<LedgerState>();
        auto access = std::make_shared<auth::AccessControl>();
        registry_ = std::make_unique<registry::PropertyRegistry>(state_, access);
        ledger_ = std::make_unique<ledger::OwnershipLedger>(state_);
        market_ = std::make_unique<Marketplace>(state_, config);

        propertyId_ = registry_->Register("Loft", 100, {"Lisbon", ""}).id;
        ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 60), LedgerError::OK);
        ASSERT_EQ(ledger_->Issue(propertyId_, "bob", 40), LedgerError::OK);
    }

    std::shared_ptr<LedgerState> state_;
    std::unique_ptr<registry::PropertyRegistry> registry_;
    std::unique_ptr<ledger::OwnershipLedger> ledger_;
    std::unique_ptr<Marketplace> market_;
    PropertyId propertyId_{INVALID_ID};
};

// ============================================================================
// Listing
// ============================================================================

TEST_F(MarketplaceTest, ListWithinBalance) {
    EXPECT_EQ(market_->List(propertyId_, "alice", 10, 5), LedgerError::OK);

    auto listings = market_->GetListings();
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].seller, "alice");
    EXPECT_EQ(listings[0].amount, 10u);
    EXPECT_EQ(listings[0].pricePerShare, 5u);
    ASSERT_TRUE(listings[0].GetTotalPrice().has_value());
    EXPECT_EQ(*listings[0].GetTotalPrice(), 50u);

    // Shares are not escrowed
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "alice"), 60u);
}

TEST_F(MarketplaceTest, ListBeyondBalance) {
    EXPECT_EQ(market_->List(propertyId_, "alice", 61, 5), LedgerError::InsufficientBalance);
    EXPECT_TRUE(market_->GetListings().empty());
}

TEST_F(MarketplaceTest, ListingsKeepInsertionOrder) {
    ASSERT_EQ(market_->List(propertyId_, "bob", 5, 9), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "alice", 5, 7), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "bob", 6, 8), LedgerError::OK);

    auto listings = market_->GetListings();
    ASSERT_EQ(listings.size(), 3u);
    EXPECT_EQ(listings[0].seller, "bob");
    EXPECT_EQ(listings[1].seller, "alice");
    EXPECT_EQ(listings[2].amount, 6u);
    EXPECT_LT(listings[0].id, listings[1].id);
}

TEST_F(MarketplaceTest, ListRejectsOverflowingTotalPrice) {
    const Amount max = std::numeric_limits<Amount>::max();
    EXPECT_EQ(market_->List(propertyId_, "alice", 2, max / 2 + 1), LedgerError::PriceOverflow);
    EXPECT_TRUE(market_->GetListings().empty());
    EXPECT_EQ(market_->GetStats().totalListed, 0u);

    EXPECT_EQ(market_->List(propertyId_, "alice", 1, max), LedgerError::OK);
    ASSERT_TRUE(market_->GetListings()[0].GetTotalPrice().has_value());
    EXPECT_EQ(*market_->GetListings()[0].GetTotalPrice(), max);
}

TEST_F(MarketplaceTest, ListingsForProperty) {
    PropertyId other = registry_->Register("Barn", 10, {"Evora", ""}).id;
    ASSERT_EQ(ledger_->Issue(other, "carol", 10), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "alice", 5, 1), LedgerError::OK);
    ASSERT_EQ(market_->List(other, "carol", 5, 1), LedgerError::OK);

    auto listings = market_->GetListingsForProperty(other);
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].seller, "carol");
}

// ============================================================================
// Buying
// ============================================================================

TEST_F(MarketplaceTest, PartialFillReducesListing) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 10, 5), LedgerError::OK);

    PurchaseResult result = market_->Buy(propertyId_, "alice", "carol", 4);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.pricePerShare, 5u);
    EXPECT_EQ(result.totalPrice, 20u);

    EXPECT_EQ(ledger_->GetBalance(propertyId_, "alice"), 56u);
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "carol"), 4u);

    auto listings = market_->GetListings();
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].amount, 6u);
}

TEST_F(MarketplaceTest, ExactFillRemovesListing) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 10, 5), LedgerError::OK);
    ASSERT_TRUE(market_->Buy(propertyId_, "alice", "carol", 10).IsOk());
    EXPECT_TRUE(market_->GetListings().empty());
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "carol"), 10u);
}

TEST_F(MarketplaceTest, BuyMatchesFirstSufficientListing) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 3, 1), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "alice", 10, 2), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "alice", 20, 3), LedgerError::OK);

    // The 3-share listing is too small; the 10-share one matches first
    PurchaseResult result = market_->Buy(propertyId_, "alice", "carol", 5);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.pricePerShare, 2u);

    auto listings = market_->GetListings();
    ASSERT_EQ(listings.size(), 3u);
    EXPECT_EQ(listings[0].amount, 3u);
    EXPECT_EQ(listings[1].amount, 5u);
    EXPECT_EQ(listings[2].amount, 20u);
}

TEST_F(MarketplaceTest, BuyRejectsOverflowingTotalBeforeSettlement) {
    Listing listing;
    listing.id = state_->nextListingId++;
    listing.propertyId = propertyId_;
    listing.seller = "alice";
    listing.amount = 10;
    listing.pricePerShare = std::numeric_limits<Amount>::max() / 4;
    state_->listings.push_back(listing);
    EXPECT_FALSE(listing.GetTotalPrice().has_value());

    PurchaseResult result = market_->Buy(propertyId_, "alice", "carol", 5);
    EXPECT_EQ(result.error, LedgerError::PriceOverflow);
    EXPECT_EQ(result.totalPrice, 0u);
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "alice"), 60u);
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "carol"), 0u);
    ASSERT_EQ(market_->GetListings().size(), 1u);
    EXPECT_EQ(market_->GetListings()[0].amount, 10u);

    // A quantity whose total fits still settles
    PurchaseResult small = market_->Buy(propertyId_, "alice", "carol", 3);
    ASSERT_TRUE(small.IsOk());
    EXPECT_EQ(small.totalPrice, 3 * listing.pricePerShare);
}

TEST_F(MarketplaceTest, BuyWithoutMatchingListing) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 5, 1), LedgerError::OK);

    EXPECT_EQ(market_->Buy(propertyId_, "alice", "carol", 6).error, LedgerError::NotFound);
    EXPECT_EQ(market_->Buy(propertyId_, "bob", "carol", 1).error, LedgerError::NotFound);
    EXPECT_EQ(market_->Buy(99, "alice", "carol", 1).error, LedgerError::NotFound);
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "carol"), 0u);
}

TEST_F(MarketplaceTest, StaleListingRejectedAndKept) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 50, 5), LedgerError::OK);
    ASSERT_EQ(ledger_->Transfer(propertyId_, "alice", "bob", 20), LedgerError::OK);

    PurchaseResult result = market_->Buy(propertyId_, "alice", "carol", 50);
    EXPECT_EQ(result.error, LedgerError::InsufficientBalance);
    EXPECT_EQ(result.totalPrice, 0u);

    EXPECT_EQ(ledger_->GetBalance(propertyId_, "alice"), 40u);
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "carol"), 0u);
    ASSERT_EQ(market_->GetListings().size(), 1u);
    EXPECT_EQ(market_->GetListings()[0].amount, 50u);

    // A smaller purchase still settles against the same listing
    EXPECT_TRUE(market_->Buy(propertyId_, "alice", "carol", 40).IsOk());
    EXPECT_EQ(market_->GetListings()[0].amount, 10u);

    EXPECT_EQ(market_->GetStats().staleRejections, 1u);
}

TEST_F(MarketplaceTest, StaleListingPurgedWhenConfigured) {
    MarketplaceConfig config;
    config.purgeStaleListings = true;
    CreateMarket(config);

    ASSERT_EQ(market_->List(propertyId_, "alice", 50, 5), LedgerError::OK);
    ASSERT_EQ(ledger_->Transfer(propertyId_, "alice", "bob", 20), LedgerError::OK);

    EXPECT_EQ(market_->Buy(propertyId_, "alice", "carol", 50).error,
              LedgerError::InsufficientBalance);
    EXPECT_TRUE(market_->GetListings().empty());
    EXPECT_EQ(market_->GetStats().stalePurged, 1u);
}

TEST_F(MarketplaceTest, SellerBuyingOwnListing) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 10, 5), LedgerError::OK);
    EXPECT_TRUE(market_->Buy(propertyId_, "alice", "alice", 10).IsOk());
    EXPECT_EQ(ledger_->GetBalance(propertyId_, "alice"), 60u);
    EXPECT_TRUE(market_->GetListings().empty());
}

TEST_F(MarketplaceTest, StatsTrackActivity) {
    ASSERT_EQ(market_->List(propertyId_, "alice", 10, 5), LedgerError::OK);
    ASSERT_EQ(market_->List(propertyId_, "bob", 10, 5), LedgerError::OK);
    ASSERT_TRUE(market_->Buy(propertyId_, "alice", "carol", 4).IsOk());
    ASSERT_TRUE(market_->Buy(propertyId_, "bob", "carol", 10).IsOk());

    MarketplaceStats stats = market_->GetStats();
    EXPECT_EQ(stats.totalListed, 2u);
    EXPECT_EQ(stats.totalPurchases, 2u);
    EXPECT_EQ(stats.sharesTraded, 14u);
    EXPECT_EQ(stats.openListings, 1u);
    EXPECT_NE(stats.ToString().find("purchases: 2"), std::string::npos);
}
