// PROPSHARE - Ledger Service
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// LedgerService owns one ledger (shared state, access control and every
// engine) and exposes the caller-facing operation set. Operations that act
// on behalf of the caller take the caller identity as their first
// argument; the transport that authenticates it is out of scope.

#ifndef PROPSHARE_SERVICE_SERVICE_H
#define PROPSHARE_SERVICE_SERVICE_H

#include <propshare/audit/auditor.h>
#include <propshare/auth/access.h>
#include <propshare/core/state.h>
#include <propshare/governance/governance.h>
#include <propshare/income/distribution.h>
#include <propshare/ledger/ownership.h>
#include <propshare/marketplace/marketplace.h>
#include <propshare/registry/registry.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace propshare {

namespace util {
class ConfigManager;
}

namespace service {

// ============================================================================
// Service Options
// ============================================================================

/**
 * Options for a ledger service.
 * Populated from the config file and command line.
 */
struct ServiceOptions {
    /// Drop listings that fail settlement because the seller moved the shares
    bool purgeStaleListings{false};

    /// Require Manager or Admin to register a property
    bool requireManagerForRegistration{false};

    /// Identity granted Admin at startup (empty: none)
    std::string bootstrapAdmin;
};

/// Read ServiceOptions from configuration
ServiceOptions LoadServiceOptions(const util::ConfigManager& config);

// ============================================================================
// Service Result
// ============================================================================

/// Error code plus a value on success
template<typename T>
struct ServiceResult {
    LedgerError error{LedgerError::OK};
    std::optional<T> value;

    bool IsOk() const { return error == LedgerError::OK; }

    static ServiceResult Ok(T v) {
        ServiceResult result;
        result.value = std::move(v);
        return result;
    }

    static ServiceResult Error(LedgerError err) {
        ServiceResult result;
        result.error = err;
        return result;
    }
};

// ============================================================================
// Ledger Service
// ============================================================================

class LedgerService {
public:
    explicit LedgerService(ServiceOptions options = {});
    ~LedgerService();

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    // === Access Control ===

    LedgerError BootstrapAdmin(const HolderId& admin);
    LedgerError SetRole(const HolderId& caller, const HolderId& identity, auth::Role role);
    LedgerError SetKycStatus(const HolderId& caller, const HolderId& identity, bool verified);
    auth::Role GetMyRole(const HolderId& caller) const;
    bool IsMyKycVerified(const HolderId& caller) const;

    // === Properties ===

    ServiceResult<registry::Property> RegisterProperty(const HolderId& caller,
                                                       const std::string& name,
                                                       Amount totalShares,
                                                       const registry::PropertyMetadata& metadata);
    LedgerError UpdatePropertyMetadata(const HolderId& caller, PropertyId id,
                                       const registry::PropertyMetadata& metadata);
    LedgerError UpdatePropertyStatus(const HolderId& caller, PropertyId id,
                                     registry::PropertyStatus status);
    std::optional<registry::Property> GetProperty(PropertyId id) const;

    // === Ownership ===

    LedgerError IssueShares(PropertyId id, const HolderId& to, Amount amount);
    LedgerError TransferShares(PropertyId id, const HolderId& from, const HolderId& to,
                               Amount amount);
    Amount GetOwnership(PropertyId id, const HolderId& holder) const;
    std::vector<ledger::OwnershipRecord> GetOwnershipStatement(const HolderId& holder) const;

    // === Income ===

    LedgerError DepositRentalIncome(PropertyId id, Amount amount);
    Amount ClaimIncome(PropertyId id, const HolderId& holder);
    Amount GetUnclaimedIncome(PropertyId id, const HolderId& holder) const;
    std::vector<income::RentalIncomeRecord> GetRentalIncomeStatement(const HolderId& holder) const;

    // === Marketplace ===

    LedgerError ListSharesForSale(PropertyId id, const HolderId& seller,
                                  Amount amount, Amount pricePerShare);
    marketplace::PurchaseResult BuyShares(PropertyId id, const HolderId& seller,
                                          const HolderId& buyer, Amount amount);
    std::vector<marketplace::Listing> GetMarketplaceListings() const;

    // === Governance ===

    governance::Proposal SubmitProposal(const HolderId& caller, PropertyId id,
                                        const std::string& description,
                                        governance::ProposalType type =
                                            governance::ProposalType::Signal);
    LedgerError VoteOnProposal(const HolderId& caller, ProposalId id, bool approve);
    LedgerError ExecuteProposal(ProposalId id);
    std::vector<governance::Proposal> GetProposals(PropertyId id) const;

    // === Audit ===

    audit::AuditReport Audit() const;

    // === Components ===

    const ServiceOptions& GetOptions() const { return options_; }
    auth::AccessControl& GetAccessControl() { return *access_; }
    registry::PropertyRegistry& GetRegistry() { return *registry_; }
    ledger::OwnershipLedger& GetLedger() { return *ledger_; }
    marketplace::Marketplace& GetMarketplace() { return *marketplace_; }
    income::IncomeDistributor& GetIncome() { return *income_; }
    governance::GovernanceEngine& GetGovernance() { return *governance_; }
    const audit::Auditor& GetAuditor() const { return *auditor_; }

private:
    /// Log a failed operation; returns err unchanged
    LedgerError Report(const char* operation, LedgerError err) const;

    ServiceOptions options_;

    std::shared_ptr<LedgerState> state_;
    std::shared_ptr<auth::AccessControl> access_;

    std::unique_ptr<registry::PropertyRegistry> registry_;
    std::unique_ptr<ledger::OwnershipLedger> ledger_;
    std::unique_ptr<marketplace::Marketplace> marketplace_;
    std::unique_ptr<income::IncomeDistributor> income_;
    std::unique_ptr<governance::GovernanceEngine> governance_;
    std::unique_ptr<audit::Auditor> auditor_;
};

} // namespace service
} // namespace propshare

#endif // PROPSHARE_SERVICE_SERVICE_H
