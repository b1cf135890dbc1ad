// SPDX-License-Identifier: MIT
/**
 * @file example_option_greeks.cc
 * @brief Black-Scholes price and Greeks for a European call/put pair
 *
 * Demonstrates:
 * - Validated solver creation via EuropeanOptionSolver::create
 * - Price, delta, vega, rho and theta (per year and per day)
 * - Put-call parity check: C - P = S - K·e^(-rT)
 * - Handling a rejected parameter set
 */

#include "papaya/option/european_option.hpp"
#include "papaya/math/black_scholes_analytics.hpp"
#include <iomanip>
#include <iostream>

using namespace papaya;

int main() {
    std::cout << "=== Black-Scholes Greeks Example ===\n\n";

    PricingParams call_params(200.0, 250.0, 1.0, 0.05, OptionType::CALL, 0.15);
    PricingParams put_params = call_params;
    put_params.option_type = OptionType::PUT;

    auto call_solver = EuropeanOptionSolver::create(call_params);
    auto put_solver = EuropeanOptionSolver::create(put_params);
    if (!call_solver || !put_solver) {
        std::cerr << "Invalid parameters\n";
        return 1;
    }

    auto call = call_solver->solve();
    auto put = put_solver->solve();
    if (!call || !put) {
        std::cerr << "Solve failed\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Call price: " << call->value() << "\n";
    std::cout << "Put  price: " << put->value() << "\n\n";

    std::cout << "Call delta: " << call->delta() << "\n";
    std::cout << "Put  delta: " << put->delta() << "\n\n";

    std::cout << "Vega      : " << call->vega() << "\n\n";

    std::cout << "Call rho  : " << call->rho() << "\n";
    std::cout << "Put  rho  : " << put->rho()
              << " (per 1%: " << put->rho_per_pct() << ")\n\n";

    std::cout << "Call theta per year: " << call->theta()
              << "; theta/day: " << call->theta_per_day() << "\n";
    std::cout << "Put  theta per year: " << put->theta()
              << "; theta/day: " << put->theta_per_day() << "\n\n";

    double lhs = call->value() - put->value();
    double rhs = parity_forward(call->spot(), call->strike(), call->rate(), call->maturity());
    std::cout << "Put-Call parity -> LHS: " << lhs << ", RHS: " << rhs << "\n\n";

    // Rejected input: zero maturity
    PricingParams expired = call_params;
    expired.maturity = 0.0;
    auto rejected = EuropeanOptionSolver::create(expired);
    if (!rejected) {
        std::cout << "Rejected expired option: " << rejected.error() << "\n";
    }

    return 0;
}
