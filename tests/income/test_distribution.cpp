// PROPSHARE - Rental Income Distribution Tests
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <gtest/gtest.h>
#include <propshare/income/distribution.h>
#include <propshare/ledger/ownership.h>
#include <propshare/registry/registry.h>

#include <limits>
#include <memory>

using namespace propshare;
using namespace propshare::income;

// ============================================================================
// Test Fixture
// ============================================================================

class DistributionTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<LedgerState>();
        auto access = std::make_shared<auth::AccessControl>();
        registry_ = std::make_unique<registry::PropertyRegistry>(state_, access);
        ledger_ = std::make_unique<ledger::OwnershipLedger>(state_);
        income_ = std::make_unique<IncomeDistributor>(state_);

        propertyId_ = registry_->Register("Loft", 100, {"Lisbon", ""}).id;
    }

    std::shared_ptr<LedgerState> state_;
    std::unique_ptr<registry::PropertyRegistry> registry_;
    std::unique_ptr<ledger::OwnershipLedger> ledger_;
    std::unique_ptr<IncomeDistributor> income_;
    PropertyId propertyId_{INVALID_ID};
};

// ============================================================================
// Deposits
// ============================================================================

TEST_F(DistributionTest, SplitsProportionallyWithFloor) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 60), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(propertyId_, "bob", 40), LedgerError::OK);

    EXPECT_EQ(income_->Deposit(propertyId_, 101), LedgerError::OK);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), 60u);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "bob"), 40u);
    EXPECT_EQ(income_->GetTotalDeposited(propertyId_), 101u);
}

TEST_F(DistributionTest, DepositsAccumulate) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 60), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(propertyId_, "bob", 40), LedgerError::OK);

    ASSERT_EQ(income_->Deposit(propertyId_, 101), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 101), LedgerError::OK);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), 120u);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "bob"), 80u);
    EXPECT_EQ(income_->GetTotalDeposited(propertyId_), 202u);
}

TEST_F(DistributionTest, UnissuedSharesEarnNothing) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 25), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 1000), LedgerError::OK);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), 250u);
}

TEST_F(DistributionTest, LargeSupplyLosesAtMostRounding) {
    const Amount total = Amount(1) << 40;
    PropertyId large = registry_->Register("Tower", total, {"Porto", ""}).id;
    ASSERT_EQ(ledger_->Issue(large, "alice", total / 2), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(large, "bob", total / 4), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(large, "carol", total / 4), LedgerError::OK);

    const Amount deposit = total - 1;
    ASSERT_EQ(income_->Deposit(large, deposit), LedgerError::OK);

    Amount alice = income_->GetUnclaimed(large, "alice");
    Amount bob = income_->GetUnclaimed(large, "bob");
    Amount carol = income_->GetUnclaimed(large, "carol");
    EXPECT_EQ(alice, (Amount(1) << 39) - 1);
    EXPECT_EQ(bob, (Amount(1) << 38) - 1);
    EXPECT_EQ(carol, (Amount(1) << 38) - 1);

    Amount distributed = alice + bob + carol;
    EXPECT_LE(distributed, deposit);
    EXPECT_LT(deposit - distributed, total);
}

TEST_F(DistributionTest, SnapshotAtDepositTime) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 100), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 100), LedgerError::OK);
    ASSERT_EQ(ledger_->Transfer(propertyId_, "alice", "bob", 100), LedgerError::OK);

    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), 100u);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "bob"), 0u);
}

TEST_F(DistributionTest, UnknownPropertyRejected) {
    EXPECT_EQ(income_->Deposit(42, 100), LedgerError::NotFound);
    EXPECT_EQ(income_->GetTotalDeposited(42), 0u);
}

TEST_F(DistributionTest, ZeroSharePropertyRejectedWithoutSideEffects) {
    PropertyId empty = registry_->Register("Empty", 0, {"", ""}).id;
    EXPECT_EQ(income_->Deposit(empty, 100), LedgerError::NotFound);
    EXPECT_EQ(income_->GetTotalDeposited(empty), 0u);
}

TEST_F(DistributionTest, DepositWithNoHoldersOnlyRecordsTotal) {
    ASSERT_EQ(income_->Deposit(propertyId_, 500), LedgerError::OK);
    EXPECT_EQ(income_->GetTotalDeposited(propertyId_), 500u);
    EXPECT_TRUE(state_->unclaimedIncome.empty());
}

TEST_F(DistributionTest, LargeAmountsDoNotOverflow) {
    const Amount big = std::numeric_limits<Amount>::max() / 2;
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 50), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, big), LedgerError::OK);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), big / 2);
}

// ============================================================================
// Claims
// ============================================================================

TEST_F(DistributionTest, ClaimIsIdempotent) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 60), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 101), LedgerError::OK);

    EXPECT_EQ(income_->Claim(propertyId_, "alice"), 60u);
    EXPECT_EQ(income_->Claim(propertyId_, "alice"), 0u);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "alice"), 0u);
}

TEST_F(DistributionTest, ClaimWithNothingOwed) {
    EXPECT_EQ(income_->Claim(propertyId_, "nobody"), 0u);
    EXPECT_EQ(income_->Claim(999, "nobody"), 0u);
}

TEST_F(DistributionTest, ClaimOnlyAffectsOneHolder) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 60), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(propertyId_, "bob", 40), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 100), LedgerError::OK);

    EXPECT_EQ(income_->Claim(propertyId_, "alice"), 60u);
    EXPECT_EQ(income_->GetUnclaimed(propertyId_, "bob"), 40u);
}

// ============================================================================
// Statements
// ============================================================================

TEST_F(DistributionTest, StatementIncludesZeroEntries) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 99), LedgerError::OK);
    ASSERT_EQ(ledger_->Issue(propertyId_, "bob", 1), LedgerError::OK);

    // bob's share of 50 floors to zero but the entry exists
    ASSERT_EQ(income_->Deposit(propertyId_, 50), LedgerError::OK);

    auto statement = income_->GetRentalIncomeStatement("bob");
    ASSERT_EQ(statement.size(), 1u);
    EXPECT_EQ(statement[0].propertyId, propertyId_);
    EXPECT_EQ(statement[0].propertyName, "Loft");
    EXPECT_EQ(statement[0].income, 0u);

    EXPECT_TRUE(income_->GetRentalIncomeStatement("carol").empty());
}

TEST_F(DistributionTest, StatementDropsClaimedEntries) {
    ASSERT_EQ(ledger_->Issue(propertyId_, "alice", 10), LedgerError::OK);
    ASSERT_EQ(income_->Deposit(propertyId_, 100), LedgerError::OK);
    ASSERT_EQ(income_->GetRentalIncomeStatement("alice").size(), 1u);

    EXPECT_EQ(income_->Claim(propertyId_, "alice"), 10u);
    EXPECT_TRUE(income_->GetRentalIncomeStatement("alice").empty());
}
