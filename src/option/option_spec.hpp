// SPDX-License-Identifier: MIT
/**
 * @file option_spec.hpp
 * @brief European option specification and parameter validation
 */

#pragma once

#include <algorithm>
#include <expected>
#include "papaya/support/error_types.hpp"

namespace papaya {

/**
 * Option type enumeration.
 */
enum class OptionType {
    CALL,
    PUT
};

/// Payoff at expiry: max(S - K, 0) for calls, max(K - S, 0) for puts
inline double intrinsic_value(double spot, double strike, OptionType type) {
    if (type == OptionType::PUT) {
        return std::max(strike - spot, 0.0);
    }
    return std::max(spot - strike, 0.0);
}

/**
 * @brief Contract and market terms of a European option
 *
 * All parameters are in consistent units:
 * - Prices in currency units
 * - Time in years
 * - Rates as decimals (e.g., 0.05 for 5%)
 *
 * Volatility is kept out of this struct; see PricingParams.
 */
struct OptionSpec {
    double spot = 0.0;             ///< Current spot price (S)
    double strike = 0.0;           ///< Strike price (K)
    double maturity = 0.0;         ///< Time to maturity in years (T)
    double rate = 0.0;             ///< Continuously compounded risk-free rate (r)
    OptionType option_type = OptionType::CALL;
};

/**
 * @brief Validate option specification parameters
 *
 * Checks for:
 * - Positive, finite spot and strike
 * - Positive, finite maturity
 * - Finite rate (negative rates are allowed)
 *
 * @param spec Option specification to validate
 * @return void on success, ValidationError on failure
 */
std::expected<void, ValidationError> validate_option_spec(const OptionSpec& spec);

/**
 * @brief Complete Black-Scholes inputs: option spec plus volatility
 */
struct PricingParams : OptionSpec {
    double volatility = 0.0;  ///< Volatility (fraction, annualized)

    PricingParams() = default;

    PricingParams(const OptionSpec& spec, double volatility_)
        : OptionSpec(spec)
        , volatility(volatility_)
    {}

    PricingParams(double spot_,
                  double strike_,
                  double maturity_,
                  double rate_,
                  OptionType type_,
                  double volatility_)
        : volatility(volatility_)
    {
        spot = spot_;
        strike = strike_;
        maturity = maturity_;
        rate = rate_;
        option_type = type_;
    }
};

/**
 * @brief Validate pricing parameters
 *
 * Runs validate_option_spec() and additionally requires a positive,
 * finite volatility.
 *
 * @param params Pricing parameters to validate
 * @return void on success, ValidationError on failure
 */
std::expected<void, ValidationError> validate_pricing_params(const PricingParams& params);

} // namespace papaya
