// PROPSHARE - Ledger Auditor Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/audit/auditor.h>
#include <propshare/util/logging.h>

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace propshare {
namespace audit {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// Length-prefixed so that adjacent fields cannot run together
void AppendField(std::string& out, const std::string& value) {
    out += std::to_string(value.size());
    out += ':';
    out += value;
    out += ';';
}

void AppendField(std::string& out, uint64_t value) {
    out += std::to_string(value);
    out += ';';
}

std::string Sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

// ============================================================================
// Report Types
// ============================================================================

std::string ConservationViolation::ToString() const {
    std::ostringstream oss;
    oss << "property " << propertyId << ": available " << sharesAvailable
        << " + circulating " << circulating << " != total " << totalShares;
    return oss.str();
}

std::string AuditReport::ToString() const {
    std::ostringstream oss;
    oss << "Audit of " << propertiesChecked << " properties: "
        << (IsConsistent() ? "consistent" : "INCONSISTENT")
        << ", " << violations.size() << " violations"
        << ", " << staleListings.size() << " stale listings"
        << ", state " << stateHash;
    return oss.str();
}

// ============================================================================
// Auditor
// ============================================================================

Auditor::Auditor(std::shared_ptr<const LedgerState> state)
    : state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("Auditor requires state");
    }
}

std::vector<ConservationViolation> Auditor::CheckConservation() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return CheckConservationLocked();
}

std::vector<StaleListing> Auditor::FindStaleListings() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return FindStaleListingsLocked();
}

std::string Auditor::GetStateHash() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return GetStateHashLocked();
}

AuditReport Auditor::Run() const {
    AuditReport report;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        report.propertiesChecked = state_->properties.size();
        report.violations = CheckConservationLocked();
        report.staleListings = FindStaleListingsLocked();
        report.stateHash = GetStateHashLocked();
    }

    for (const auto& violation : report.violations) {
        LOG_ERROR(util::LogCategory::AUDIT) << "Conservation violated: " << violation.ToString();
    }
    for (const auto& stale : report.staleListings) {
        LOG_WARN(util::LogCategory::AUDIT) << "Stale " << stale.listing.ToString()
                                           << " (seller holds " << stale.sellerBalance << ")";
    }
    LOG_INFO(util::LogCategory::AUDIT) << report.ToString();
    return report;
}

std::vector<ConservationViolation> Auditor::CheckConservationLocked() const {
    std::vector<ConservationViolation> violations;
    for (const auto& [id, property] : state_->properties) {
        Amount circulating = state_->GetCirculating(id);
        bool ok = property.sharesAvailable <= property.totalShares &&
                  circulating == property.totalShares - property.sharesAvailable;
        if (!ok) {
            ConservationViolation violation;
            violation.propertyId = id;
            violation.totalShares = property.totalShares;
            violation.sharesAvailable = property.sharesAvailable;
            violation.circulating = circulating;
            violations.push_back(violation);
        }
    }
    return violations;
}

std::vector<StaleListing> Auditor::FindStaleListingsLocked() const {
    std::vector<StaleListing> stale;
    for (const auto& listing : state_->listings) {
        Amount balance = state_->GetBalance(listing.propertyId, listing.seller);
        if (balance < listing.amount) {
            stale.push_back({listing, balance});
        }
    }
    return stale;
}

std::string Auditor::GetStateHashLocked() const {
    std::string data;

    data += "properties;";
    for (const auto& [id, property] : state_->properties) {
        AppendField(data, id);
        AppendField(data, property.name);
        AppendField(data, property.totalShares);
        AppendField(data, property.sharesAvailable);
        AppendField(data, property.metadata.location);
        AppendField(data, property.metadata.description);
        AppendField(data, static_cast<uint64_t>(property.status));
    }

    data += "ownership;";
    for (const auto& [key, balance] : state_->ownership) {
        AppendField(data, key.first);
        AppendField(data, key.second);
        AppendField(data, balance);
    }

    data += "deposits;";
    for (const auto& [id, total] : state_->totalDeposited) {
        AppendField(data, id);
        AppendField(data, total);
    }

    data += "unclaimed;";
    for (const auto& [key, income] : state_->unclaimedIncome) {
        AppendField(data, key.first);
        AppendField(data, key.second);
        AppendField(data, income);
    }

    data += "proposals;";
    for (const auto& [id, proposal] : state_->proposals) {
        AppendField(data, id);
        AppendField(data, proposal.propertyId);
        AppendField(data, proposal.proposer);
        AppendField(data, proposal.description);
        AppendField(data, static_cast<uint64_t>(proposal.type));
        AppendField(data, static_cast<uint64_t>(proposal.status));
        AppendField(data, proposal.yesVotes);
        AppendField(data, proposal.noVotes);
        for (const auto& [voter, choice] : proposal.votes) {
            AppendField(data, voter);
            AppendField(data, static_cast<uint64_t>(choice));
        }
    }

    return Sha256Hex(data);
}

} // namespace audit
} // namespace propshare
