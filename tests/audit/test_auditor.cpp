// PROPSHARE - Ledger Auditor Tests
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <gtest/gtest.h>
#include <propshare/audit/auditor.h>
#include <propshare/income/distribution.h>
#include <propshare/ledger/ownership.h>
#include <propshare/marketplace/marketplace.h>
#include <propshare/registry/registry.h>

#include <memory>

using namespace propshare;
using namespace propshare::audit;

// ============================================================================
// Test Fixture
// ============================================================================

class AuditorTest : public ::testing::Test {
protected:
    struct Ledger {
        std::shared_ptr<LedgerState> state = std::make_shared<LedgerState>();
        std::shared_ptr<auth::AccessControl> access = std::make_shared<auth::AccessControl>();
        registry::PropertyRegistry registry{state, access};
        ledger::OwnershipLedger ownership{state};
        marketplace::Marketplace market{state};
        income::IncomeDistributor income{state};
        Auditor auditor{state};
    };

    /// Same operations, same resulting state
    void Populate(Ledger& l) {
        PropertyId id = l.registry.Register("Loft", 100, {"Lisbon", "two rooms"}).id;
        ASSERT_EQ(l.ownership.Issue(id, "alice", 60), LedgerError::OK);
        ASSERT_EQ(l.ownership.Issue(id, "bob", 40), LedgerError::OK);
        ASSERT_EQ(l.income.Deposit(id, 101), LedgerError::OK);
    }
};

TEST_F(AuditorTest, EmptyLedgerIsConsistent) {
    Ledger l;
    AuditReport report = l.auditor.Run();
    EXPECT_TRUE(report.IsConsistent());
    EXPECT_EQ(report.propertiesChecked, 0u);
    EXPECT_TRUE(report.staleListings.empty());
    EXPECT_EQ(report.stateHash.size(), 64u);
}

TEST_F(AuditorTest, OperationsPreserveConservation) {
    Ledger l;
    Populate(l);
    ASSERT_EQ(l.ownership.Transfer(1, "alice", "carol", 15), LedgerError::OK);
    ASSERT_EQ(l.market.List(1, "bob", 10, 3), LedgerError::OK);
    ASSERT_TRUE(l.market.Buy(1, "bob", "dave", 10).IsOk());

    EXPECT_TRUE(l.auditor.CheckConservation().empty());
    AuditReport report = l.auditor.Run();
    EXPECT_TRUE(report.IsConsistent());
    EXPECT_EQ(report.propertiesChecked, 1u);
}

TEST_F(AuditorTest, DetectsCorruptedBalance) {
    Ledger l;
    Populate(l);
    {
        std::lock_guard<std::mutex> lock(l.state->mutex);
        l.state->Credit(1, "mallory", 5);
    }

    auto violations = l.auditor.CheckConservation();
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].propertyId, 1u);
    EXPECT_EQ(violations[0].circulating, 105u);
    EXPECT_EQ(violations[0].totalShares, 100u);
    EXPECT_FALSE(l.auditor.Run().IsConsistent());
}

TEST_F(AuditorTest, ReportsStaleListings) {
    Ledger l;
    Populate(l);
    ASSERT_EQ(l.market.List(1, "alice", 50, 2), LedgerError::OK);
    EXPECT_TRUE(l.auditor.FindStaleListings().empty());

    ASSERT_EQ(l.ownership.Transfer(1, "alice", "bob", 20), LedgerError::OK);

    auto stale = l.auditor.FindStaleListings();
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].listing.seller, "alice");
    EXPECT_EQ(stale[0].sellerBalance, 40u);

    // Stale listings do not break conservation
    EXPECT_TRUE(l.auditor.Run().IsConsistent());
}

TEST_F(AuditorTest, EqualStatesHashEqual) {
    Ledger a;
    Ledger b;
    Populate(a);
    Populate(b);
    EXPECT_EQ(a.auditor.GetStateHash(), b.auditor.GetStateHash());
}

TEST_F(AuditorTest, HashIndependentOfHistory) {
    Ledger a;
    Ledger b;
    Populate(a);
    Populate(b);

    // Out and back again leaves the same state
    ASSERT_EQ(b.ownership.Transfer(1, "alice", "bob", 10), LedgerError::OK);
    ASSERT_EQ(b.ownership.Transfer(1, "bob", "alice", 10), LedgerError::OK);
    EXPECT_EQ(a.auditor.GetStateHash(), b.auditor.GetStateHash());
}

TEST_F(AuditorTest, HashChangesWithState) {
    Ledger l;
    Populate(l);
    std::string before = l.auditor.GetStateHash();

    ASSERT_EQ(l.ownership.Transfer(1, "alice", "bob", 1), LedgerError::OK);
    EXPECT_NE(l.auditor.GetStateHash(), before);
}

TEST_F(AuditorTest, HashCoversUnclaimedIncome) {
    Ledger l;
    Populate(l);
    std::string before = l.auditor.GetStateHash();

    EXPECT_EQ(l.income.Claim(1, "alice"), 60u);
    EXPECT_NE(l.auditor.GetStateHash(), before);
}
