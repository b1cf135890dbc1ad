// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>

namespace papaya {

/// Solver error categories surfaced through expected results.
/// Closed-form solve() has no failure path of its own.
enum class SolverErrorCode {
    Unknown
};

/// Detailed solver error passed through expected failure path
struct SolverError {
    SolverErrorCode code{SolverErrorCode::Unknown};
};

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidStrike,
    InvalidSpotPrice,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidPrice,
    InvalidAmount,
    InvalidCurrency,
    InsufficientData
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for series errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Reasons a quote update does not replace the last quote
enum class QuoteErrorCode {
    NegativePrice,  ///< Dropped, nothing stored
    PriorDate       ///< Older than the last quote, filed into history only
};

/// Quote update failure with the offending price
struct QuoteError {
    QuoteErrorCode code;
    double price;
};

inline const char* to_string(SolverErrorCode code) {
    switch (code) {
        case SolverErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidStrike: return "InvalidStrike";
        case ValidationErrorCode::InvalidSpotPrice: return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidMaturity: return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility: return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate: return "InvalidRate";
        case ValidationErrorCode::InvalidPrice: return "InvalidPrice";
        case ValidationErrorCode::InvalidAmount: return "InvalidAmount";
        case ValidationErrorCode::InvalidCurrency: return "InvalidCurrency";
        case ValidationErrorCode::InsufficientData: return "InsufficientData";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for SolverError
inline std::ostream& operator<<(std::ostream& os, const SolverError& err) {
    os << "SolverError{code=" << to_string(err.code) << "}";
    return os;
}

/// Output stream operator for QuoteError
inline std::ostream& operator<<(std::ostream& os, const QuoteError& err) {
    switch (err.code) {
        case QuoteErrorCode::NegativePrice:
            os << "Negative Price Exception for price " << err.price;
            break;
        case QuoteErrorCode::PriorDate:
            os << "Prior Date Exception for price " << err.price;
            break;
    }
    return os;
}

} // namespace papaya
