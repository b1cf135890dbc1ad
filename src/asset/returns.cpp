// SPDX-License-Identifier: MIT
#include "papaya/asset/returns.hpp"
#include "papaya/support/papaya_trace.h"
#include <cmath>

namespace papaya {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value, size_t index) {
    PAPAYA_TRACE_VALIDATION_ERROR(MODULE_RETURNS, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

/// Error index is first when initial is invalid, first + 1 when final is
std::expected<void, ValidationError>
check_pair(double initial, double final_value, ReturnMethod method, size_t first = 0) {
    if (initial == 0.0 || !std::isfinite(initial)) {
        return reject(ValidationErrorCode::InvalidPrice, initial, first);
    }
    if (!std::isfinite(final_value)) {
        return reject(ValidationErrorCode::InvalidPrice, final_value, first + 1);
    }
    if (method == ReturnMethod::Log) {
        if (initial < 0.0) {
            return reject(ValidationErrorCode::InvalidPrice, initial, first);
        }
        if (final_value <= 0.0) {
            return reject(ValidationErrorCode::InvalidPrice, final_value, first + 1);
        }
    }
    return {};
}

double raw_return(double initial, double final_value, ReturnMethod method) {
    if (method == ReturnMethod::Log) {
        return std::log(final_value / initial);
    }
    return (final_value - initial) / initial;
}

}  // namespace

std::expected<double, ValidationError>
compute_return(double initial, double final_value, ReturnMethod method) {
    auto check = check_pair(initial, final_value, method);
    if (!check) {
        return std::unexpected(check.error());
    }
    return raw_return(initial, final_value, method);
}

std::expected<std::vector<double>, ValidationError>
compute_returns(std::span<const double> prices, ReturnMethod method) {
    if (prices.size() < 2) {
        return reject(ValidationErrorCode::InsufficientData,
                      static_cast<double>(prices.size()), 0);
    }

    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        auto check = check_pair(prices[i - 1], prices[i], method, i - 1);
        if (!check) {
            return std::unexpected(check.error());
        }
        returns.push_back(raw_return(prices[i - 1], prices[i], method));
    }
    return returns;
}

}  // namespace papaya
