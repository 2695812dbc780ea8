// PROPSHARE - Core Types Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include "propshare/core/types.h"

#include <limits>
#include <stdexcept>

namespace propshare {

// ============================================================================
// Arithmetic Helpers
// ============================================================================

namespace {

/// 128-bit unsigned value as two 64-bit limbs
struct Wide {
    uint64_t hi{0};
    uint64_t lo{0};
};

/// Full 64x64 -> 128-bit product using 32-bit partial products
Wide WideMultiply(uint64_t a, uint64_t b) {
    const uint64_t mask = 0xFFFFFFFFULL;
    uint64_t aLo = a & mask, aHi = a >> 32;
    uint64_t bLo = b & mask, bHi = b >> 32;

    uint64_t ll = aLo * bLo;
    uint64_t lh = aLo * bHi;
    uint64_t hl = aHi * bLo;
    uint64_t hh = aHi * bHi;

    uint64_t mid = (ll >> 32) + (lh & mask) + (hl & mask);

    Wide result;
    result.lo = (mid << 32) | (ll & mask);
    result.hi = hh + (lh >> 32) + (hl >> 32) + (mid >> 32);
    return result;
}

/// Restoring division of a 128-bit value by a 64-bit divisor.
/// Requires value.hi < divisor so the quotient fits 64 bits.
uint64_t WideDivide(const Wide& value, uint64_t divisor) {
    uint64_t rem = value.hi;
    uint64_t quotient = 0;
    for (int bit = 63; bit >= 0; --bit) {
        bool carry = (rem >> 63) != 0;
        rem = (rem << 1) | ((value.lo >> bit) & 1);
        quotient <<= 1;
        if (carry || rem >= divisor) {
            rem -= divisor;
            quotient |= 1;
        }
    }
    return quotient;
}

} // namespace

Amount MulDivFloor(Amount value, Amount numerator, Amount denominator) {
    if (denominator == 0) {
        throw std::invalid_argument("MulDivFloor: zero denominator");
    }

    Wide product = WideMultiply(value, numerator);
    if (product.hi >= denominator) {
        throw std::overflow_error("MulDivFloor: result exceeds 64 bits");
    }
    return WideDivide(product, denominator);
}

std::optional<Amount> CheckedMultiply(Amount a, Amount b) {
    if (a != 0 && b > std::numeric_limits<Amount>::max() / a) {
        return std::nullopt;
    }
    return a * b;
}

// ============================================================================
// LedgerError Implementation
// ============================================================================

const char* LedgerErrorToString(LedgerError err) {
    switch (err) {
        case LedgerError::OK: return "OK";
        case LedgerError::NotFound: return "NotFound";
        case LedgerError::Unauthorized: return "Unauthorized";
        case LedgerError::InsufficientBalance: return "InsufficientBalance";
        case LedgerError::InsufficientSupply: return "InsufficientSupply";
        case LedgerError::AlreadyBootstrapped: return "AlreadyBootstrapped";
        case LedgerError::NotVotable: return "NotVotable";
        case LedgerError::NotExecutable: return "NotExecutable";
        case LedgerError::PriceOverflow: return "PriceOverflow";
        default: return "Unknown";
    }
}

const char* LedgerErrorDescription(LedgerError err) {
    switch (err) {
        case LedgerError::OK: return "Success";
        case LedgerError::NotFound: return "Property, listing or proposal not found";
        case LedgerError::Unauthorized: return "Caller role does not permit this operation";
        case LedgerError::InsufficientBalance: return "Not enough shares held";
        case LedgerError::InsufficientSupply: return "Not enough shares available for issuance";
        case LedgerError::AlreadyBootstrapped: return "Admin already bootstrapped";
        case LedgerError::NotVotable:
            return "Proposal not found, not open, already voted, or no shares";
        case LedgerError::NotExecutable: return "Proposal not found or not open";
        case LedgerError::PriceOverflow: return "Total price exceeds the representable range";
        default: return "Unknown error";
    }
}

std::optional<LedgerError> ParseLedgerError(const std::string& str) {
    if (str == "OK") return LedgerError::OK;
    if (str == "NotFound") return LedgerError::NotFound;
    if (str == "Unauthorized") return LedgerError::Unauthorized;
    if (str == "InsufficientBalance") return LedgerError::InsufficientBalance;
    if (str == "InsufficientSupply") return LedgerError::InsufficientSupply;
    if (str == "AlreadyBootstrapped") return LedgerError::AlreadyBootstrapped;
    if (str == "NotVotable") return LedgerError::NotVotable;
    if (str == "NotExecutable") return LedgerError::NotExecutable;
    if (str == "PriceOverflow") return LedgerError::PriceOverflow;
    return std::nullopt;
}

} // namespace propshare
