// PROPSHARE - Property Record
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Defines the property record tracked by the registry.

#ifndef PROPSHARE_REGISTRY_PROPERTY_H
#define PROPSHARE_REGISTRY_PROPERTY_H

#include <propshare/core/types.h>

#include <optional>
#include <string>

namespace propshare {
namespace registry {

/// Lifecycle status of a property
enum class PropertyStatus {
    Active,
    Maintenance,
    Sold
};

/// Convert status to string
const char* PropertyStatusToString(PropertyStatus status);

/// Parse status from string (case-insensitive)
std::optional<PropertyStatus> ParsePropertyStatus(const std::string& str);

/// Free-form descriptive fields; no invariant attached
struct PropertyMetadata {
    std::string location;
    std::string description;

    bool operator==(const PropertyMetadata& other) const {
        return location == other.location && description == other.description;
    }
    bool operator!=(const PropertyMetadata& other) const { return !(*this == other); }
};

/**
 * A registered property.
 *
 * totalShares is fixed at registration. sharesAvailable counts shares not
 * yet issued to any holder: 0 <= sharesAvailable <= totalShares.
 */
struct Property {
    PropertyId id{INVALID_ID};
    std::string name;
    Amount totalShares{0};
    Amount sharesAvailable{0};
    PropertyMetadata metadata;
    PropertyStatus status{PropertyStatus::Active};

    /// Shares currently held by holders
    Amount GetIssuedShares() const { return totalShares - sharesAvailable; }

    /// Get human-readable description
    std::string ToString() const;
};

} // namespace registry
} // namespace propshare

#endif // PROPSHARE_REGISTRY_PROPERTY_H
