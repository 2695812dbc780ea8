// PROPSHARE - Property Registry
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Registers properties and maintains their descriptive fields. Share
// supply is changed only by issuance in the ownership ledger.

#ifndef PROPSHARE_REGISTRY_REGISTRY_H
#define PROPSHARE_REGISTRY_REGISTRY_H

#include <propshare/auth/access.h>
#include <propshare/core/state.h>
#include <propshare/registry/property.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace propshare {
namespace registry {

class PropertyRegistry {
public:
    PropertyRegistry(std::shared_ptr<LedgerState> state,
                     std::shared_ptr<const auth::IAuthorizationGate> gate);

    /**
     * Register a new property. All shares start unissued.
     *
     * A totalShares of zero is accepted; such a property can never
     * receive income.
     */
    Property Register(const std::string& name, Amount totalShares,
                      const PropertyMetadata& metadata);

    /// Replace metadata (actor must be Admin)
    LedgerError UpdateMetadata(PropertyId id, const PropertyMetadata& metadata,
                               const HolderId& actor);

    /// Change lifecycle status (actor must be Admin)
    LedgerError UpdateStatus(PropertyId id, PropertyStatus status,
                             const HolderId& actor);

    std::optional<Property> GetProperty(PropertyId id) const;

    /// All properties ordered by id
    std::vector<Property> GetAllProperties() const;

    size_t GetPropertyCount() const;

private:
    std::shared_ptr<LedgerState> state_;
    std::shared_ptr<const auth::IAuthorizationGate> gate_;
};

} // namespace registry
} // namespace propshare

#endif // PROPSHARE_REGISTRY_REGISTRY_H
