// PROPSHARE - Ownership Ledger Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/ledger/ownership.h>
#include <propshare/util/logging.h>

#include <stdexcept>

namespace propshare {
namespace ledger {

OwnershipLedger::OwnershipLedger(std::shared_ptr<LedgerState> state)
    : state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("OwnershipLedger requires state");
    }
}

LedgerError OwnershipLedger::Issue(PropertyId propertyId, const HolderId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    registry::Property* property = state_->FindProperty(propertyId);
    if (!property) {
        return LedgerError::NotFound;
    }
    if (amount > property->sharesAvailable) {
        LOG_INFO(util::LogCategory::LEDGER) << "Issue of " << amount << " shares of property "
                                            << propertyId << " exceeds supply "
                                            << property->sharesAvailable;
        return LedgerError::InsufficientSupply;
    }

    property->sharesAvailable -= amount;
    state_->Credit(propertyId, to, amount);

    LOG_DEBUG(util::LogCategory::LEDGER) << "Issued " << amount << " shares of property "
                                         << propertyId << " to " << to;
    return LedgerError::OK;
}

LedgerError OwnershipLedger::Transfer(PropertyId propertyId, const HolderId& from,
                                      const HolderId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    if (from == to) {
        return state_->GetBalance(propertyId, from) < amount
            ? LedgerError::InsufficientBalance : LedgerError::OK;
    }
    if (!state_->Debit(propertyId, from, amount)) {
        return LedgerError::InsufficientBalance;
    }
    state_->Credit(propertyId, to, amount);

    LOG_DEBUG(util::LogCategory::LEDGER) << "Transferred " << amount << " shares of property "
                                         << propertyId << " from " << from << " to " << to;
    return LedgerError::OK;
}

Amount OwnershipLedger::GetBalance(PropertyId propertyId, const HolderId& holder) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->GetBalance(propertyId, holder);
}

std::map<HolderId, Amount> OwnershipLedger::GetHolders(PropertyId propertyId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->GetHolders(propertyId);
}

Amount OwnershipLedger::GetCirculatingShares(PropertyId propertyId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->GetCirculating(propertyId);
}

std::vector<OwnershipRecord> OwnershipLedger::GetOwnershipStatement(const HolderId& holder) const {
    std::lock_guard<std::mutex> lock(state_->mutex);

    std::vector<OwnershipRecord> statement;
    for (const auto& [key, shares] : state_->ownership) {
        if (key.second != holder || shares == 0) {
            continue;
        }
        OwnershipRecord record;
        record.propertyId = key.first;
        record.propertyName = state_->GetPropertyName(key.first);
        record.shares = shares;
        statement.push_back(record);
    }
    return statement;
}

} // namespace ledger
} // namespace propshare
