// PROPSHARE - Ledger Service Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/service/service.h>
#include <propshare/util/config.h>
#include <propshare/util/logging.h>

namespace propshare {
namespace service {

ServiceOptions LoadServiceOptions(const util::ConfigManager& config) {
    ServiceOptions options;
    options.purgeStaleListings = config.GetBool(util::ConfigKeys::PURGESTALE,
                                                options.purgeStaleListings,
                                                util::ConfigKeys::MARKET_SECTION);
    options.requireManagerForRegistration = config.GetBool(util::ConfigKeys::REQUIREMANAGER,
                                                           options.requireManagerForRegistration,
                                                           util::ConfigKeys::REGISTRY_SECTION);
    options.bootstrapAdmin = config.GetString(util::ConfigKeys::BOOTSTRAPADMIN, "");
    return options;
}

// ============================================================================
// LedgerService
// ============================================================================

LedgerService::LedgerService(ServiceOptions options)
    : options_(std::move(options))
    , state_(std::make_shared<LedgerState>())
    , access_(std::make_shared<auth::AccessControl>()) {
    marketplace::MarketplaceConfig marketConfig;
    marketConfig.purgeStaleListings = options_.purgeStaleListings;

    registry_ = std::make_unique<registry::PropertyRegistry>(state_, access_);
    ledger_ = std::make_unique<ledger::OwnershipLedger>(state_);
    marketplace_ = std::make_unique<marketplace::Marketplace>(state_, marketConfig);
    income_ = std::make_unique<income::IncomeDistributor>(state_);
    governance_ = std::make_unique<governance::GovernanceEngine>(state_);
    auditor_ = std::make_unique<audit::Auditor>(state_);

    if (!options_.bootstrapAdmin.empty() &&
        access_->BootstrapAdmin(options_.bootstrapAdmin) != LedgerError::OK) {
        LOG_WARN(util::LogCategory::SERVICE) << "Could not bootstrap admin "
                                             << options_.bootstrapAdmin;
    }

    LOG_DEBUG(util::LogCategory::SERVICE) << "Ledger service started (purgestale="
                                          << options_.purgeStaleListings << ", requiremanager="
                                          << options_.requireManagerForRegistration << ")";
}

LedgerService::~LedgerService() = default;

LedgerError LedgerService::Report(const char* operation, LedgerError err) const {
    if (err != LedgerError::OK) {
        LOG_INFO(util::LogCategory::SERVICE) << operation << " failed: "
                                             << LedgerErrorToString(err);
    }
    return err;
}

// ============================================================================
// Access Control
// ============================================================================

LedgerError LedgerService::BootstrapAdmin(const HolderId& admin) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "bootstrap_admin " << admin;
    return Report("bootstrap_admin", access_->BootstrapAdmin(admin));
}

LedgerError LedgerService::SetRole(const HolderId& caller, const HolderId& identity,
                                   auth::Role role) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "set_role " << identity << " "
                                          << auth::RoleToString(role) << " by " << caller;
    return Report("set_role", access_->SetRole(caller, identity, role));
}

LedgerError LedgerService::SetKycStatus(const HolderId& caller, const HolderId& identity,
                                        bool verified) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "set_kyc_status " << identity << " " << verified
                                          << " by " << caller;
    return Report("set_kyc_status", access_->SetKycStatus(caller, identity, verified));
}

auth::Role LedgerService::GetMyRole(const HolderId& caller) const {
    return access_->GetRole(caller);
}

bool LedgerService::IsMyKycVerified(const HolderId& caller) const {
    return access_->IsKycVerified(caller);
}

// ============================================================================
// Properties
// ============================================================================

ServiceResult<registry::Property> LedgerService::RegisterProperty(
    const HolderId& caller, const std::string& name, Amount totalShares,
    const registry::PropertyMetadata& metadata) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "register_property \"" << name << "\" "
                                          << totalShares << " by " << caller;

    if (options_.requireManagerForRegistration && !access_->IsManagerOrAdmin(caller)) {
        return ServiceResult<registry::Property>::Error(
            Report("register_property", LedgerError::Unauthorized));
    }
    return ServiceResult<registry::Property>::Ok(
        registry_->Register(name, totalShares, metadata));
}

LedgerError LedgerService::UpdatePropertyMetadata(const HolderId& caller, PropertyId id,
                                                  const registry::PropertyMetadata& metadata) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "update_property_metadata " << id << " by " << caller;
    return Report("update_property_metadata", registry_->UpdateMetadata(id, metadata, caller));
}

LedgerError LedgerService::UpdatePropertyStatus(const HolderId& caller, PropertyId id,
                                                registry::PropertyStatus status) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "update_property_status " << id << " "
                                          << registry::PropertyStatusToString(status)
                                          << " by " << caller;
    return Report("update_property_status", registry_->UpdateStatus(id, status, caller));
}

std::optional<registry::Property> LedgerService::GetProperty(PropertyId id) const {
    return registry_->GetProperty(id);
}

// ============================================================================
// Ownership
// ============================================================================

LedgerError LedgerService::IssueShares(PropertyId id, const HolderId& to, Amount amount) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "issue_shares " << id << " " << to << " " << amount;
    return Report("issue_shares", ledger_->Issue(id, to, amount));
}

LedgerError LedgerService::TransferShares(PropertyId id, const HolderId& from,
                                          const HolderId& to, Amount amount) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "transfer_shares " << id << " " << from << " "
                                          << to << " " << amount;
    return Report("transfer_shares", ledger_->Transfer(id, from, to, amount));
}

Amount LedgerService::GetOwnership(PropertyId id, const HolderId& holder) const {
    return ledger_->GetBalance(id, holder);
}

std::vector<ledger::OwnershipRecord> LedgerService::GetOwnershipStatement(
    const HolderId& holder) const {
    return ledger_->GetOwnershipStatement(holder);
}

// ============================================================================
// Income
// ============================================================================

LedgerError LedgerService::DepositRentalIncome(PropertyId id, Amount amount) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "deposit_rental_income " << id << " " << amount;
    return Report("deposit_rental_income", income_->Deposit(id, amount));
}

Amount LedgerService::ClaimIncome(PropertyId id, const HolderId& holder) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "claim_income " << id << " " << holder;
    return income_->Claim(id, holder);
}

Amount LedgerService::GetUnclaimedIncome(PropertyId id, const HolderId& holder) const {
    return income_->GetUnclaimed(id, holder);
}

std::vector<income::RentalIncomeRecord> LedgerService::GetRentalIncomeStatement(
    const HolderId& holder) const {
    return income_->GetRentalIncomeStatement(holder);
}

// ============================================================================
// Marketplace
// ============================================================================

LedgerError LedgerService::ListSharesForSale(PropertyId id, const HolderId& seller,
                                             Amount amount, Amount pricePerShare) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "list_shares_for_sale " << id << " " << seller
                                          << " " << amount << " @ " << pricePerShare;
    return Report("list_shares_for_sale", marketplace_->List(id, seller, amount, pricePerShare));
}

marketplace::PurchaseResult LedgerService::BuyShares(PropertyId id, const HolderId& seller,
                                                     const HolderId& buyer, Amount amount) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "buy_shares " << id << " " << seller << " "
                                          << buyer << " " << amount;
    marketplace::PurchaseResult result = marketplace_->Buy(id, seller, buyer, amount);
    Report("buy_shares", result.error);
    return result;
}

std::vector<marketplace::Listing> LedgerService::GetMarketplaceListings() const {
    return marketplace_->GetListings();
}

// ============================================================================
// Governance
// ============================================================================

governance::Proposal LedgerService::SubmitProposal(const HolderId& caller, PropertyId id,
                                                   const std::string& description,
                                                   governance::ProposalType type) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "submit_proposal " << id << " by " << caller;
    return governance_->Submit(id, description, caller, type);
}

LedgerError LedgerService::VoteOnProposal(const HolderId& caller, ProposalId id, bool approve) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "vote_on_proposal " << id << " "
                                          << (approve ? "yes" : "no") << " by " << caller;
    return Report("vote_on_proposal", governance_->Vote(id, caller, approve));
}

LedgerError LedgerService::ExecuteProposal(ProposalId id) {
    LOG_DEBUG(util::LogCategory::SERVICE) << "execute_proposal " << id;
    return Report("execute_proposal", governance_->Execute(id));
}

std::vector<governance::Proposal> LedgerService::GetProposals(PropertyId id) const {
    return governance_->GetProposals(id);
}

// ============================================================================
// Audit
// ============================================================================

audit::AuditReport LedgerService::Audit() const {
    return auditor_->Run();
}

} // namespace service
} // namespace propshare
