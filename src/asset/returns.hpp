// SPDX-License-Identifier: MIT
/**
 * @file returns.hpp
 * @brief Simple and logarithmic returns between prices
 */

#pragma once

#include "papaya/support/error_types.hpp"
#include <expected>
#include <span>
#include <vector>

namespace papaya {

enum class ReturnMethod {
    Simple,  ///< (final - initial) / initial
    Log      ///< ln(final / initial)
};

/**
 * @brief Return between two prices
 *
 * @return InvalidPrice if initial is zero or non-finite, or, for Log, if
 *         either price is non-positive
 */
std::expected<double, ValidationError>
compute_return(double initial, double final_value, ReturnMethod method = ReturnMethod::Simple);

/**
 * @brief Returns between consecutive prices of a series
 *
 * Output has prices.size() - 1 entries.
 *
 * @return InsufficientData for fewer than two prices; InvalidPrice with the
 *         index of the offending price otherwise
 */
std::expected<std::vector<double>, ValidationError>
compute_returns(std::span<const double> prices, ReturnMethod method = ReturnMethod::Simple);

}  // namespace papaya
