// SPDX-License-Identifier: MIT
/**
 * @file quantlib_european_accuracy.cc
 * @brief Accuracy comparison between papaya and QuantLib for European options
 *
 * Prices each scenario with QuantLib's AnalyticEuropeanEngine and with
 * EuropeanOptionSolver, then reports absolute errors on price and Greeks.
 * QuantLib quotes theta per year and rho per unit rate, the same units
 * EuropeanOptionResult uses.
 *
 * Requires: libquantlib0-dev
 */

#include "papaya/option/european_option.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <stdexcept>
#include <string>

#include <ql/quantlib.hpp>

using namespace papaya;
namespace ql = QuantLib;

// ============================================================================
// Helper: QuantLib European Option Pricer
// ============================================================================

struct PricingResult {
    double price;
    double delta;
    double vega;
    double rho;
    double theta;
};

PricingResult price_european_option_quantlib(
    double spot,
    double strike,
    double maturity,
    double volatility,
    double rate,
    bool is_call)
{
    ql::Date today = ql::Date::todaysDate();
    ql::Settings::instance().evaluationDate() = today;

    ql::DayCounter dc = ql::Actual365Fixed();
    ql::Date maturity_date = today + static_cast<int>(std::lround(maturity * 365));

    auto exercise = ql::ext::make_shared<ql::EuropeanExercise>(maturity_date);
    auto payoff = ql::ext::make_shared<ql::PlainVanillaPayoff>(
        is_call ? ql::Option::Call : ql::Option::Put, strike);

    ql::Handle<ql::Quote> spot_handle(ql::ext::make_shared<ql::SimpleQuote>(spot));
    ql::Handle<ql::YieldTermStructure> rate_ts(
        ql::ext::make_shared<ql::FlatForward>(today, rate, dc));
    ql::Handle<ql::YieldTermStructure> div_ts(
        ql::ext::make_shared<ql::FlatForward>(today, 0.0, dc));
    ql::Handle<ql::BlackVolTermStructure> vol_ts(
        ql::ext::make_shared<ql::BlackConstantVol>(today, ql::NullCalendar(), volatility, dc));

    auto process = ql::ext::make_shared<ql::BlackScholesMertonProcess>(
        spot_handle, div_ts, rate_ts, vol_ts);

    ql::VanillaOption option(payoff, exercise);
    option.setPricingEngine(ql::ext::make_shared<ql::AnalyticEuropeanEngine>(process));

    return {option.NPV(), option.delta(), option.vega(), option.rho(), option.theta()};
}

// ============================================================================
// Comparison
// ============================================================================

static void compare_scenario(
    benchmark::State& state,
    const std::string& label,
    double spot,
    double strike,
    double maturity,
    double volatility,
    double rate,
    bool is_call)
{
    auto ql_result = price_european_option_quantlib(
        spot, strike, maturity, volatility, rate, is_call);

    PricingParams params(spot, strike, maturity, rate,
                         is_call ? OptionType::CALL : OptionType::PUT, volatility);
    auto solver = EuropeanOptionSolver::create(params);
    if (!solver) {
        throw std::runtime_error("Invalid parameters for " + label);
    }
    auto result = solver->solve();
    if (!result) {
        throw std::runtime_error("Solve failed for " + label);
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(result->value());
    }

    double price_error = std::abs(result->value() - ql_result.price);
    double delta_error = std::abs(result->delta() - ql_result.delta);
    double vega_error = std::abs(result->vega() - ql_result.vega);
    double rho_error = std::abs(result->rho() - ql_result.rho);
    double theta_error = std::abs(result->theta() - ql_result.theta);

    state.SetLabel(label + ": Price err=" + std::to_string(price_error));

    state.counters["ql_price"] = ql_result.price;
    state.counters["papaya_price"] = result->value();
    state.counters["price_abs_err"] = price_error;
    state.counters["delta_abs_err"] = delta_error;
    state.counters["vega_abs_err"] = vega_error;
    state.counters["rho_abs_err"] = rho_error;
    state.counters["theta_abs_err"] = theta_error;
}

// ============================================================================
// Accuracy Test Cases
// ============================================================================

static void BM_Accuracy_ATM_Call_1Y(benchmark::State& state) {
    compare_scenario(state, "ATM Call 1Y", 100.0, 100.0, 1.0, 0.20, 0.05, true);
}
BENCHMARK(BM_Accuracy_ATM_Call_1Y)->Iterations(1);

static void BM_Accuracy_ATM_Put_1Y(benchmark::State& state) {
    compare_scenario(state, "ATM Put 1Y", 100.0, 100.0, 1.0, 0.20, 0.05, false);
}
BENCHMARK(BM_Accuracy_ATM_Put_1Y)->Iterations(1);

static void BM_Accuracy_OTM_Call_1Y(benchmark::State& state) {
    compare_scenario(state, "OTM Call S=200 K=250", 200.0, 250.0, 1.0, 0.15, 0.05, true);
}
BENCHMARK(BM_Accuracy_OTM_Call_1Y)->Iterations(1);

static void BM_Accuracy_ITM_Put_1Y(benchmark::State& state) {
    compare_scenario(state, "ITM Put S=200 K=250", 200.0, 250.0, 1.0, 0.15, 0.05, false);
}
BENCHMARK(BM_Accuracy_ITM_Put_1Y)->Iterations(1);

static void BM_Accuracy_ShortMaturity_Call_1M(benchmark::State& state) {
    compare_scenario(state, "Short Call 1M", 100.0, 95.0, 30.0 / 365.0, 0.25, 0.03, true);
}
BENCHMARK(BM_Accuracy_ShortMaturity_Call_1M)->Iterations(1);

static void BM_Accuracy_HighVol_Put_2Y(benchmark::State& state) {
    compare_scenario(state, "High Vol Put 2Y", 100.0, 110.0, 2.0, 0.60, 0.04, false);
}
BENCHMARK(BM_Accuracy_HighVol_Put_2Y)->Iterations(1);

BENCHMARK_MAIN();
