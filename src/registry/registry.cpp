// PROPSHARE - Property Registry Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/registry/registry.h>
#include <propshare/util/logging.h>

#include <stdexcept>

namespace propshare {
namespace registry {

PropertyRegistry::PropertyRegistry(std::shared_ptr<LedgerState> state,
                                   std::shared_ptr<const auth::IAuthorizationGate> gate)
    : state_(std::move(state)), gate_(std::move(gate)) {
    if (!state_ || !gate_) {
        throw std::invalid_argument("PropertyRegistry requires state and gate");
    }
}

Property PropertyRegistry::Register(const std::string& name, Amount totalShares,
                                    const PropertyMetadata& metadata) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    Property property;
    property.id = state_->nextPropertyId++;
    property.name = name;
    property.totalShares = totalShares;
    property.sharesAvailable = totalShares;
    property.metadata = metadata;
    property.status = PropertyStatus::Active;

    state_->properties[property.id] = property;

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Registered " << property.ToString();
    return property;
}

LedgerError PropertyRegistry::UpdateMetadata(PropertyId id, const PropertyMetadata& metadata,
                                             const HolderId& actor) {
    if (!gate_->IsAdmin(actor)) {
        return LedgerError::Unauthorized;
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    Property* property = state_->FindProperty(id);
    if (!property) {
        return LedgerError::NotFound;
    }

    property->metadata = metadata;
    LOG_DEBUG(util::LogCategory::REGISTRY) << "Metadata of property " << id
                                           << " updated by " << actor;
    return LedgerError::OK;
}

LedgerError PropertyRegistry::UpdateStatus(PropertyId id, PropertyStatus status,
                                           const HolderId& actor) {
    if (!gate_->IsAdmin(actor)) {
        return LedgerError::Unauthorized;
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    Property* property = state_->FindProperty(id);
    if (!property) {
        return LedgerError::NotFound;
    }

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Property " << id << " status "
                                           << PropertyStatusToString(property->status)
                                           << " -> " << PropertyStatusToString(status);
    property->status = status;
    return LedgerError::OK;
}

std::optional<Property> PropertyRegistry::GetProperty(PropertyId id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    const Property* property = state_->FindProperty(id);
    if (!property) {
        return std::nullopt;
    }
    return *property;
}

std::vector<Property> PropertyRegistry::GetAllProperties() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Property> result;
    result.reserve(state_->properties.size());
    for (const auto& [id, property] : state_->properties) {
        result.push_back(property);
    }
    return result;
}

size_t PropertyRegistry::GetPropertyCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->properties.size();
}

} // namespace registry
} // namespace propshare
