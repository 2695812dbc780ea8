// PROPSHARE - Property Record Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/registry/property.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace propshare {
namespace registry {

const char* PropertyStatusToString(PropertyStatus status) {
    switch (status) {
        case PropertyStatus::Active: return "Active";
        case PropertyStatus::Maintenance: return "Maintenance";
        case PropertyStatus::Sold: return "Sold";
        default: return "Unknown";
    }
}

std::optional<PropertyStatus> ParsePropertyStatus(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "active") return PropertyStatus::Active;
    if (lower == "maintenance") return PropertyStatus::Maintenance;
    if (lower == "sold") return PropertyStatus::Sold;
    return std::nullopt;
}

std::string Property::ToString() const {
    std::ostringstream oss;
    oss << "Property #" << id << " \"" << name << "\""
        << " [" << PropertyStatusToString(status) << "]"
        << " shares " << sharesAvailable << "/" << totalShares << " available";
    if (!metadata.location.empty()) {
        oss << ", " << metadata.location;
    }
    return oss.str();
}

} // namespace registry
} // namespace propshare
