// PROPSHARE - Access Control
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Resolves caller identities to a role and a KYC flag.
//
// The engines only consult the IAuthorizationGate interface. AccessControl
// is the in-process implementation: a sparse map with explicit defaults
// (role User, KYC false) plus the one-time admin bootstrap and the
// admin-only role/KYC setters.

#ifndef PROPSHARE_AUTH_ACCESS_H
#define PROPSHARE_AUTH_ACCESS_H

#include <propshare/core/types.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace propshare {
namespace auth {

/// Caller roles
enum class Role {
    Admin,
    Manager,
    User
};

/// Convert role to string
const char* RoleToString(Role role);

/// Parse role from string (case-insensitive)
std::optional<Role> ParseRole(const std::string& str);

/// Role assumed for identities with no explicit assignment
constexpr Role DEFAULT_ROLE = Role::User;

// ============================================================================
// Authorization Gate Interface
// ============================================================================

/**
 * Read-only view used by the engines. Both lookups are total: every
 * identity has a role and a KYC flag.
 */
class IAuthorizationGate {
public:
    virtual ~IAuthorizationGate() = default;

    /// Role of an identity (DEFAULT_ROLE when unassigned)
    virtual Role GetRole(const HolderId& identity) const = 0;

    /// KYC flag of an identity (false when unassigned)
    virtual bool IsKycVerified(const HolderId& identity) const = 0;

    /// Convenience: role == Admin
    bool IsAdmin(const HolderId& identity) const {
        return GetRole(identity) == Role::Admin;
    }

    /// Convenience: role is Admin or Manager
    bool IsManagerOrAdmin(const HolderId& identity) const {
        Role role = GetRole(identity);
        return role == Role::Admin || role == Role::Manager;
    }
};

// ============================================================================
// Access Control
// ============================================================================

class AccessControl : public IAuthorizationGate {
public:
    AccessControl();
    ~AccessControl() override;

    Role GetRole(const HolderId& identity) const override;
    bool IsKycVerified(const HolderId& identity) const override;

    /**
     * Grant Admin to the first identity that calls this.
     *
     * @return AlreadyBootstrapped on every call after the first
     */
    LedgerError BootstrapAdmin(const HolderId& admin);

    /// Check if bootstrap has been performed
    bool IsBootstrapped() const;

    /// Assign a role (actor must be Admin)
    LedgerError SetRole(const HolderId& actor, const HolderId& identity, Role role);

    /// Set KYC status (actor must be Admin)
    LedgerError SetKycStatus(const HolderId& actor, const HolderId& identity, bool verified);

    /// Number of explicit role assignments
    size_t GetRoleAssignmentCount() const;

private:
    mutable std::mutex mutex_;
    std::map<HolderId, Role> roles_;
    std::map<HolderId, bool> kyc_;
    bool bootstrapped_{false};
};

} // namespace auth
} // namespace propshare

#endif // PROPSHARE_AUTH_ACCESS_H
