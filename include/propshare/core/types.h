// PROPSHARE - Core Types Header
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// This file defines fundamental types used throughout PROPSHARE.

#ifndef PROPSHARE_CORE_TYPES_H
#define PROPSHARE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

namespace propshare {

// ============================================================================
// Basic Types
// ============================================================================

/// Property identifier (monotonically assigned, first id is 1)
using PropertyId = uint64_t;

/// Governance proposal identifier (monotonically assigned, first id is 1)
using ProposalId = uint64_t;

/// Marketplace listing identifier
using ListingId = uint64_t;

/// Opaque caller/holder identity, supplied by the transport layer
using HolderId = std::string;

/// Share counts and income units
using Amount = uint64_t;

/// Id value that is never assigned
constexpr uint64_t INVALID_ID = 0;

// ============================================================================
// Arithmetic Helpers
// ============================================================================

/**
 * Compute floor(value * numerator / denominator) exactly. The product is
 * formed in 128 bits, so any 64-bit operands are accepted.
 *
 * @param denominator Must be non-zero (std::invalid_argument otherwise)
 * @throws std::overflow_error if the result does not fit in 64 bits,
 *         which cannot happen when numerator <= denominator
 */
Amount MulDivFloor(Amount value, Amount numerator, Amount denominator);

/// a * b, or nullopt when the product does not fit in 64 bits
std::optional<Amount> CheckedMultiply(Amount a, Amount b);

// ============================================================================
// Result Type
// ============================================================================

/// Error codes returned by every ledger operation
enum class LedgerError {
    OK = 0,

    /// Referenced property, listing or proposal does not exist
    NotFound,

    /// Caller's role does not meet the operation's requirement
    Unauthorized,

    /// Holder balance is below the requested quantity
    InsufficientBalance,

    /// Property supply is below the requested quantity
    InsufficientSupply,

    /// One-time admin bootstrap already performed
    AlreadyBootstrapped,

    /// Proposal missing, not open, already voted or voter holds no shares
    NotVotable,

    /// Proposal missing or not open
    NotExecutable,

    /// Quantity times price per share does not fit in an Amount
    PriceOverflow,
};

/// Convert error to its name ("NotFound", ...)
const char* LedgerErrorToString(LedgerError err);

/// Human-readable description of an error
const char* LedgerErrorDescription(LedgerError err);

/// Parse error from its name
std::optional<LedgerError> ParseLedgerError(const std::string& str);

/// True when the operation succeeded
inline bool IsOk(LedgerError err) {
    return err == LedgerError::OK;
}

} // namespace propshare

#endif // PROPSHARE_CORE_TYPES_H
