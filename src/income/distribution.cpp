// PROPSHARE - Rental Income Distribution Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/income/distribution.h>
#include <propshare/util/logging.h>

#include <stdexcept>

namespace propshare {
namespace income {

IncomeDistributor::IncomeDistributor(std::shared_ptr<LedgerState> state)
    : state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("IncomeDistributor requires state");
    }
}

LedgerError IncomeDistributor::Deposit(PropertyId propertyId, Amount amount) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    const registry::Property* property = state_->FindProperty(propertyId);
    if (!property || property->totalShares == 0) {
        return LedgerError::NotFound;
    }

    state_->totalDeposited[propertyId] += amount;

    Amount distributed = 0;
    for (const auto& [holder, balance] : state_->GetHolders(propertyId)) {
        Amount share = MulDivFloor(amount, balance, property->totalShares);
        state_->unclaimedIncome[HoldingKey(propertyId, holder)] += share;
        distributed += share;
    }

    LOG_DEBUG(util::LogCategory::INCOME) << "Deposit of " << amount << " to property "
                                         << propertyId << ": " << distributed
                                         << " distributed, " << (amount - distributed)
                                         << " unallocated";
    return LedgerError::OK;
}

Amount IncomeDistributor::Claim(PropertyId propertyId, const HolderId& holder) {
    std::lock_guard<std::mutex> lock(state_->mutex);

    auto it = state_->unclaimedIncome.find(HoldingKey(propertyId, holder));
    if (it == state_->unclaimedIncome.end()) {
        return 0;
    }

    Amount amount = it->second;
    state_->unclaimedIncome.erase(it);

    LOG_DEBUG(util::LogCategory::INCOME) << holder << " claimed " << amount
                                         << " from property " << propertyId;
    return amount;
}

Amount IncomeDistributor::GetUnclaimed(PropertyId propertyId, const HolderId& holder) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->unclaimedIncome.find(HoldingKey(propertyId, holder));
    return it != state_->unclaimedIncome.end() ? it->second : 0;
}

Amount IncomeDistributor::GetTotalDeposited(PropertyId propertyId) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->totalDeposited.find(propertyId);
    return it != state_->totalDeposited.end() ? it->second : 0;
}

std::vector<RentalIncomeRecord> IncomeDistributor::GetRentalIncomeStatement(
    const HolderId& holder) const {
    std::lock_guard<std::mutex> lock(state_->mutex);

    std::vector<RentalIncomeRecord> statement;
    for (const auto& [key, income] : state_->unclaimedIncome) {
        if (key.second != holder) {
            continue;
        }
        RentalIncomeRecord record;
        record.propertyId = key.first;
        record.propertyName = state_->GetPropertyName(key.first);
        record.income = income;
        statement.push_back(record);
    }
    return statement;
}

} // namespace income
} // namespace propshare
