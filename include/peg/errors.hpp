#ifndef PEG_ERRORS_HPP
#define PEG_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace peg {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,

    // Validation (rejected before any mutation)
    ZERO_AMOUNT = -1,
    ASSET_NOT_ALLOWED = -2,
    LENGTH_MISMATCH = -3,
    INVALID_CONFIG = -4,
    INVALID_AMOUNT = -5,

    // Ledger guards
    INSUFFICIENT_COLLATERAL = -10,
    INSUFFICIENT_DEBT = -11,

    // Fixed-point arithmetic
    ARITHMETIC_OVERFLOW = -12,
    DIVISION_BY_ZERO = -13,

    // Solvency invariant
    BREAKS_HEALTH_FACTOR = -20,
    HEALTH_FACTOR_BROKEN = -21,

    // Collaborators
    TRANSFER_FAILED = -30,
    MINT_FAILED = -31,

    // Oracle
    ORACLE_STALE = -40,
    ORACLE_UNAVAILABLE = -41,
    INVALID_PRICE = -42,

    // Liquidation
    HEALTH_FACTOR_OK = -50,
    HEALTH_FACTOR_NOT_IMPROVED = -51,

    REENTRANCY = -60
};

inline constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::ZERO_AMOUNT: return "ZERO_AMOUNT";
        case ErrorCode::ASSET_NOT_ALLOWED: return "ASSET_NOT_ALLOWED";
        case ErrorCode::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::INSUFFICIENT_COLLATERAL: return "INSUFFICIENT_COLLATERAL";
        case ErrorCode::INSUFFICIENT_DEBT: return "INSUFFICIENT_DEBT";
        case ErrorCode::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ErrorCode::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case ErrorCode::BREAKS_HEALTH_FACTOR: return "BREAKS_HEALTH_FACTOR";
        case ErrorCode::HEALTH_FACTOR_BROKEN: return "HEALTH_FACTOR_BROKEN";
        case ErrorCode::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case ErrorCode::MINT_FAILED: return "MINT_FAILED";
        case ErrorCode::ORACLE_STALE: return "ORACLE_STALE";
        case ErrorCode::ORACLE_UNAVAILABLE: return "ORACLE_UNAVAILABLE";
        case ErrorCode::INVALID_PRICE: return "INVALID_PRICE";
        case ErrorCode::HEALTH_FACTOR_OK: return "HEALTH_FACTOR_OK";
        case ErrorCode::HEALTH_FACTOR_NOT_IMPROVED: return "HEALTH_FACTOR_NOT_IMPROVED";
        case ErrorCode::REENTRANCY: return "REENTRANCY";
    }
    return "UNKNOWN";
}

// =============================================================================
// Exceptions
// =============================================================================

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Zero amount, disallowed asset, malformed construction or configuration
class ValidationError : public Error {
public:
    using Error::Error;
};

// Explicit balance guards (withdraw or burn beyond what is recorded)
class LedgerError : public Error {
public:
    using Error::Error;
};

class ArithmeticError : public Error {
public:
    using Error::Error;
};

// Health factor below the minimum; carries the computed ratio
class InvariantViolation : public Error {
public:
    InvariantViolation(ErrorCode code, const std::string& msg, U128 health_factor_x18)
        : Error(code, msg), health_factor_x18_(health_factor_x18) {}

    U128 health_factor() const noexcept { return health_factor_x18_; }

private:
    U128 health_factor_x18_;
};

// Transfer, mint or burn refused by a collaborator
class CollaboratorError : public Error {
public:
    using Error::Error;
};

// Stale, unavailable or malformed price
class OracleError : public Error {
public:
    using Error::Error;
};

// Target not eligible, or liquidation would not improve it
class LiquidationError : public Error {
public:
    LiquidationError(ErrorCode code, const std::string& msg, U128 health_factor_x18)
        : Error(code, msg), health_factor_x18_(health_factor_x18) {}

    U128 health_factor() const noexcept { return health_factor_x18_; }

private:
    U128 health_factor_x18_;
};

class ReentrancyError : public Error {
public:
    explicit ReentrancyError(const std::string& msg)
        : Error(ErrorCode::REENTRANCY, msg) {}
};

} // namespace peg

#endif // PEG_ERRORS_HPP
