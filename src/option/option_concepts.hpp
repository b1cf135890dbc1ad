// SPDX-License-Identifier: MIT
/**
 * @file option_concepts.hpp
 * @brief Concepts over priced options: inputs, first-order Greeks, solvers
 */

#pragma once

#include "papaya/option/option_spec.hpp"
#include <concepts>
#include <expected>

namespace papaya {

/// Exposes the Black-Scholes inputs it was priced with
template <typename R>
concept HasPricingInputs = requires(const R& r) {
    { r.spot() } -> std::convertible_to<double>;
    { r.strike() } -> std::convertible_to<double>;
    { r.maturity() } -> std::convertible_to<double>;
    { r.rate() } -> std::convertible_to<double>;
    { r.volatility() } -> std::convertible_to<double>;
    { r.option_type() } -> std::same_as<OptionType>;
};

/// Sensitivities to spot, volatility, rate and time
template <typename R>
concept HasFirstOrderGreeks = requires(const R& r) {
    { r.delta() } -> std::convertible_to<double>;
    { r.vega() } -> std::convertible_to<double>;
    { r.rho() } -> std::convertible_to<double>;
    { r.theta() } -> std::convertible_to<double>;
};

/**
 * @brief A priced option: value now and at any spot, Greeks, inputs
 */
template <typename R>
concept OptionResult = HasPricingInputs<R> && HasFirstOrderGreeks<R> &&
    requires(const R& r, double S) {
        { r.value() } -> std::convertible_to<double>;
        { r.value_at(S) } -> std::convertible_to<double>;
    };

/**
 * @brief Solver whose solve() yields std::expected<OptionResult, E>
 */
template <typename S>
concept OptionSolver = requires(const S& solver) {
    typename decltype(solver.solve())::value_type;
    typename decltype(solver.solve())::error_type;
    requires OptionResult<typename decltype(solver.solve())::value_type>;
};

}  // namespace papaya
