// PROPSHARE - Access Control Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/auth/access.h>
#include <propshare/util/logging.h>

#include <algorithm>
#include <cctype>

namespace propshare {
namespace auth {

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* RoleToString(Role role) {
    switch (role) {
        case Role::Admin: return "Admin";
        case Role::Manager: return "Manager";
        case Role::User: return "User";
        default: return "Unknown";
    }
}

std::optional<Role> ParseRole(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "admin") return Role::Admin;
    if (lower == "manager") return Role::Manager;
    if (lower == "user") return Role::User;
    return std::nullopt;
}

// ============================================================================
// AccessControl Implementation
// ============================================================================

AccessControl::AccessControl() = default;
AccessControl::~AccessControl() = default;

Role AccessControl::GetRole(const HolderId& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roles_.find(identity);
    return it != roles_.end() ? it->second : DEFAULT_ROLE;
}

bool AccessControl::IsKycVerified(const HolderId& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = kyc_.find(identity);
    return it != kyc_.end() ? it->second : false;
}

LedgerError AccessControl::BootstrapAdmin(const HolderId& admin) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (bootstrapped_) {
        LOG_WARN(util::LogCategory::AUTH) << "Rejected second admin bootstrap for " << admin;
        return LedgerError::AlreadyBootstrapped;
    }

    roles_[admin] = Role::Admin;
    bootstrapped_ = true;

    LOG_INFO(util::LogCategory::AUTH) << "Admin bootstrapped: " << admin;
    return LedgerError::OK;
}

bool AccessControl::IsBootstrapped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bootstrapped_;
}

LedgerError AccessControl::SetRole(const HolderId& actor, const HolderId& identity, Role role) {
    if (!IsAdmin(actor)) {
        return LedgerError::Unauthorized;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    roles_[identity] = role;

    LOG_DEBUG(util::LogCategory::AUTH) << actor << " set role of " << identity
                                       << " to " << RoleToString(role);
    return LedgerError::OK;
}

LedgerError AccessControl::SetKycStatus(const HolderId& actor, const HolderId& identity,
                                        bool verified) {
    if (!IsAdmin(actor)) {
        return LedgerError::Unauthorized;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    kyc_[identity] = verified;

    LOG_DEBUG(util::LogCategory::AUTH) << actor << " set KYC of " << identity
                                       << " to " << (verified ? "verified" : "unverified");
    return LedgerError::OK;
}

size_t AccessControl::GetRoleAssignmentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roles_.size();
}

} // namespace auth
} // namespace propshare
