// PROPSHARE - Marketplace Listing Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/marketplace/listing.h>

#include <sstream>

namespace propshare {
namespace marketplace {

std::string Listing::ToString() const {
    std::ostringstream oss;
    oss << "Listing #" << id << ": " << seller << " sells " << amount
        << " of property " << propertyId << " @ " << pricePerShare;
    return oss.str();
}

} // namespace marketplace
} // namespace propshare
