// PROPSHARE - Shared Ledger State Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include "propshare/core/state.h"

namespace propshare {

registry::Property* LedgerState::FindProperty(PropertyId id) {
    auto it = properties.find(id);
    return it != properties.end() ? &it->second : nullptr;
}

const registry::Property* LedgerState::FindProperty(PropertyId id) const {
    auto it = properties.find(id);
    return it != properties.end() ? &it->second : nullptr;
}

Amount LedgerState::GetBalance(PropertyId propertyId, const HolderId& holder) const {
    auto it = ownership.find(HoldingKey(propertyId, holder));
    return it != ownership.end() ? it->second : 0;
}

void LedgerState::Credit(PropertyId propertyId, const HolderId& holder, Amount amount) {
    if (amount == 0) {
        return;
    }
    ownership[HoldingKey(propertyId, holder)] += amount;
}

bool LedgerState::Debit(PropertyId propertyId, const HolderId& holder, Amount amount) {
    auto it = ownership.find(HoldingKey(propertyId, holder));
    Amount current = it != ownership.end() ? it->second : 0;
    if (current < amount) {
        return false;
    }
    if (amount == 0) {
        return true;
    }

    it->second -= amount;
    if (it->second == 0) {
        ownership.erase(it);
    }
    return true;
}

std::map<HolderId, Amount> LedgerState::GetHolders(PropertyId propertyId) const {
    std::map<HolderId, Amount> result;
    // Keys are ordered by property first, so the range is contiguous
    auto it = ownership.lower_bound(HoldingKey(propertyId, HolderId()));
    for (; it != ownership.end() && it->first.first == propertyId; ++it) {
        if (it->second > 0) {
            result[it->first.second] = it->second;
        }
    }
    return result;
}

Amount LedgerState::GetCirculating(PropertyId propertyId) const {
    Amount total = 0;
    auto it = ownership.lower_bound(HoldingKey(propertyId, HolderId()));
    for (; it != ownership.end() && it->first.first == propertyId; ++it) {
        total += it->second;
    }
    return total;
}

std::string LedgerState::GetPropertyName(PropertyId id) const {
    const registry::Property* property = FindProperty(id);
    return property ? property->name : std::string();
}

} // namespace propshare
