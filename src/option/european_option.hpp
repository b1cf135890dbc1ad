// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes formulas
 *
 * Provides EuropeanOptionResult (satisfies OptionResult) and
 * EuropeanOptionSolver for analytical European option pricing with
 * first-order Greeks.
 */

#pragma once

#include "papaya/option/option_spec.hpp"
#include "papaya/option/option_concepts.hpp"
#include "papaya/option/greek_conventions.hpp"
#include <expected>
#include <utility>

namespace papaya {

/**
 * @brief European option pricing result with closed-form Greeks
 *
 * Stores the pricing parameters and computes price/Greeks on each call.
 * Nothing is cached.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class EuropeanOptionResult {
public:
    explicit EuropeanOptionResult(const PricingParams& params,
                                  GreekConventions conventions = {});

    /// Option value at current spot
    double value() const;

    /// Option value at arbitrary spot price
    double value_at(double S) const;

    /// d1 = [ln(S/K) + (r + σ²/2)T] / (σ√T)
    double d1() const;

    /// d2 = d1 - σ√T
    double d2() const;

    /// Delta: dV/dS
    double delta() const;

    /// Vega: dV/dσ (same for calls and puts)
    double vega() const;

    /// Rho: dV/dr
    double rho() const;

    /// Rho scaled to a conventions().rate_bump move in rate
    double rho_per_pct() const;

    /// Theta per year: dV/dt (time decay, typically negative)
    double theta() const;

    /// Theta per calendar day
    double theta_per_day() const;

    // Parameter accessors
    double spot() const { return params_.spot; }
    double strike() const { return params_.strike; }
    double maturity() const { return params_.maturity; }
    double rate() const { return params_.rate; }
    double volatility() const { return params_.volatility; }
    OptionType option_type() const { return params_.option_type; }
    const PricingParams& params() const { return params_; }
    const GreekConventions& conventions() const { return conventions_; }

private:
    PricingParams params_;
    GreekConventions conventions_;
};

/**
 * @brief European option solver using closed-form Black-Scholes
 *
 * Lightweight solver that delegates to analytical formulas.
 */
class EuropeanOptionSolver {
public:
    /// Construct solver from pricing parameters (no validation)
    explicit EuropeanOptionSolver(const PricingParams& params,
                                  GreekConventions conventions = {});

    /// Construct from option spec + volatility (convenience)
    EuropeanOptionSolver(const OptionSpec& spec, double sigma);

    /// Factory with validation via validate_pricing_params()
    static std::expected<EuropeanOptionSolver, ValidationError>
    create(const PricingParams& params, GreekConventions conventions = {}) noexcept;

    /// Compute European option price and Greeks (always succeeds)
    std::expected<EuropeanOptionResult, SolverError> solve() const;

private:
    PricingParams params_;
    GreekConventions conventions_;
};

static_assert(OptionResult<EuropeanOptionResult>);
static_assert(OptionSolver<EuropeanOptionSolver>);

}  // namespace papaya
