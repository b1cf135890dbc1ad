// SPDX-License-Identifier: MIT
#include "papaya/option/european_option.hpp"
#include "papaya/math/black_scholes_analytics.hpp"
#include "papaya/support/papaya_trace.h"

namespace papaya {

// ===========================================================================
// EuropeanOptionResult
// ===========================================================================

EuropeanOptionResult::EuropeanOptionResult(const PricingParams& params,
                                           GreekConventions conventions)
    : params_(params)
    , conventions_(conventions)
{}

double EuropeanOptionResult::value() const {
    return value_at(params_.spot);
}

double EuropeanOptionResult::value_at(double S) const {
    return bs_price(S, params_.strike, params_.maturity, params_.volatility,
                    params_.rate, params_.option_type);
}

double EuropeanOptionResult::d1() const {
    return bs_d1(params_.spot, params_.strike, params_.maturity,
                 params_.volatility, params_.rate);
}

double EuropeanOptionResult::d2() const {
    return bs_d2(params_.spot, params_.strike, params_.maturity,
                 params_.volatility, params_.rate);
}

double EuropeanOptionResult::delta() const {
    return bs_delta(params_.spot, params_.strike, params_.maturity,
                    params_.volatility, params_.rate, params_.option_type);
}

double EuropeanOptionResult::vega() const {
    return bs_vega(params_.spot, params_.strike, params_.maturity,
                   params_.volatility, params_.rate);
}

double EuropeanOptionResult::rho() const {
    return bs_rho(params_.spot, params_.strike, params_.maturity,
                  params_.volatility, params_.rate, params_.option_type);
}

double EuropeanOptionResult::rho_per_pct() const {
    return conventions_.rate_bump * rho();
}

double EuropeanOptionResult::theta() const {
    return bs_theta(params_.spot, params_.strike, params_.maturity,
                    params_.volatility, params_.rate, params_.option_type);
}

double EuropeanOptionResult::theta_per_day() const {
    return theta() / conventions_.days_per_year;
}

// ===========================================================================
// EuropeanOptionSolver
// ===========================================================================

EuropeanOptionSolver::EuropeanOptionSolver(const PricingParams& params,
                                           GreekConventions conventions)
    : params_(params)
    , conventions_(conventions)
{}

EuropeanOptionSolver::EuropeanOptionSolver(const OptionSpec& spec, double sigma)
    : params_(spec, sigma)
{}

std::expected<EuropeanOptionSolver, ValidationError>
EuropeanOptionSolver::create(const PricingParams& params, GreekConventions conventions) noexcept {
    auto validation = validate_pricing_params(params);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return EuropeanOptionSolver(params, conventions);
}

std::expected<EuropeanOptionResult, SolverError> EuropeanOptionSolver::solve() const {
    PAPAYA_TRACE_ALGO_START(MODULE_EUROPEAN_OPTION, params_.spot, params_.strike,
                            params_.maturity);
    EuropeanOptionResult result(params_, conventions_);
    PAPAYA_TRACE_ALGO_COMPLETE(MODULE_EUROPEAN_OPTION, 1, result.value());
    return result;
}

}  // namespace papaya
