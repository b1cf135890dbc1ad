// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

#include "papaya/option/option_spec.hpp"

namespace papaya {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x)
inline double norm_cdf(double x) {
    // Use erfc for numerical stability
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-Scholes d1 term
/// d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ)
///
/// Requires S > 0, K > 0, τ > 0, σ > 0.
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Black-Scholes d2 = d1 - σ√τ
inline double bs_d2(double spot, double strike, double tau, double sigma, double rate) {
    return bs_d1(spot, strike, tau, sigma, rate) - sigma * std::sqrt(tau);
}

/// Put-call parity right-hand side: C - P = S - K·e^(-rτ)
inline double parity_forward(double spot, double strike, double rate, double tau) {
    return spot - strike * std::exp(-rate * tau);
}

/// Black-Scholes option price
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param rate Risk-free rate
/// @param option_type PUT or CALL
/// @return European option price
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    // Edge cases: zero maturity or zero vol -> intrinsic value
    if (tau <= 0.0 || sigma <= 0.0) {
        if (tau <= 0.0) {
            return intrinsic_value(spot, strike, option_type);
        }
        // Zero vol, positive maturity: discounted intrinsic
        return intrinsic_value(spot, strike * std::exp(-rate * tau), option_type);
    }

    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = d1 - sigma * std::sqrt(tau);
    double exp_rt = std::exp(-rate * tau);

    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    } else {
        return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
    }
}

/// Black-Scholes Delta: Φ(d1) for calls, Φ(d1) - 1 for puts
inline double bs_delta(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    if (tau <= 0.0 || sigma <= 0.0) {
        // Degenerate: step function of moneyness against the discounted strike
        double k_eff = tau <= 0.0 ? strike : strike * std::exp(-rate * tau);
        if (option_type == OptionType::PUT) {
            return (spot < k_eff) ? -1.0 : 0.0;
        }
        return (spot > k_eff) ? 1.0 : 0.0;
    }

    double nd1 = norm_cdf(bs_d1(spot, strike, tau, sigma, rate));
    return option_type == OptionType::PUT ? nd1 - 1.0 : nd1;
}

/// Black-Scholes Vega: ∂V/∂σ = S · √τ · φ(d1)
/// Same for puts and calls
inline double bs_vega(double spot, double strike, double tau, double sigma, double rate) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    return spot * std::sqrt(tau) * norm_pdf(d1);
}

/// Black-Scholes Rho: ∂V/∂r
/// Call: τ·K·e^(-rτ)·Φ(d2), Put: -τ·K·e^(-rτ)·Φ(-d2)
inline double bs_rho(double spot, double strike, double tau, double sigma, double rate,
                     OptionType option_type) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d2 = bs_d2(spot, strike, tau, sigma, rate);
    double k_disc = strike * std::exp(-rate * tau);
    if (option_type == OptionType::PUT) {
        return -tau * k_disc * norm_cdf(-d2);
    }
    return tau * k_disc * norm_cdf(d2);
}

/// Black-Scholes Theta per year (time decay, typically negative)
/// Common term: -S·φ(d1)·σ/(2√τ)
/// Call: common - r·K·e^(-rτ)·Φ(d2), Put: common + r·K·e^(-rτ)·Φ(-d2)
inline double bs_theta(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double sqrt_tau = std::sqrt(tau);
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = d1 - sigma * sqrt_tau;
    double k_disc = strike * std::exp(-rate * tau);

    double common = -spot * norm_pdf(d1) * sigma / (2.0 * sqrt_tau);
    if (option_type == OptionType::PUT) {
        return common + rate * k_disc * norm_cdf(-d2);
    }
    return common - rate * k_disc * norm_cdf(d2);
}

}  // namespace papaya
