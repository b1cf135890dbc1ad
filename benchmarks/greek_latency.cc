// SPDX-License-Identifier: MIT
/// @file greek_latency.cc
/// @brief Latency benchmark: per-query time for price, delta, vega, rho, theta
///
/// Benchmarks the closed-form free functions on a single ATM point, then
/// the full validate + solve + query path through EuropeanOptionSolver.
/// Reports ns/query.
///
/// Usage:
///   ./build/benchmarks/greek_latency

#include "papaya/math/black_scholes_analytics.hpp"
#include "papaya/option/european_option.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace papaya;

namespace {

constexpr double kSpot = 100.0;
constexpr double kStrike = 100.0;
constexpr double kTau = 1.0;
constexpr double kSigma = 0.20;
constexpr double kRate = 0.05;

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

static void BM_Price_Call(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_price(spot, kStrike, kTau, kSigma, kRate, OptionType::CALL));
    }
}
BENCHMARK(BM_Price_Call);

static void BM_Price_Put(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_price(spot, kStrike, kTau, kSigma, kRate, OptionType::PUT));
    }
}
BENCHMARK(BM_Price_Put);

static void BM_Delta(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_delta(spot, kStrike, kTau, kSigma, kRate, OptionType::CALL));
    }
}
BENCHMARK(BM_Delta);

static void BM_Vega(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_vega(spot, kStrike, kTau, kSigma, kRate));
    }
}
BENCHMARK(BM_Vega);

static void BM_Rho(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_rho(spot, kStrike, kTau, kSigma, kRate, OptionType::PUT));
    }
}
BENCHMARK(BM_Rho);

static void BM_Theta(benchmark::State& state) {
    double spot = kSpot;
    for (auto _ : state) {
        benchmark::DoNotOptimize(spot);
        benchmark::DoNotOptimize(bs_theta(spot, kStrike, kTau, kSigma, kRate, OptionType::CALL));
    }
}
BENCHMARK(BM_Theta);

// ============================================================================
// Solver path
// ============================================================================

static void BM_Solver_CreateSolve(benchmark::State& state) {
    PricingParams params(kSpot, kStrike, kTau, kRate, OptionType::PUT, kSigma);
    for (auto _ : state) {
        benchmark::DoNotOptimize(params);
        auto solver = EuropeanOptionSolver::create(params);
        if (!solver) {
            throw std::runtime_error("EuropeanOptionSolver::create failed");
        }
        auto result = solver->solve();
        if (!result) {
            throw std::runtime_error("EuropeanOptionSolver::solve failed");
        }
        benchmark::DoNotOptimize(result->value());
    }
}
BENCHMARK(BM_Solver_CreateSolve);

static void BM_Result_AllGreeks(benchmark::State& state) {
    EuropeanOptionResult result(
        PricingParams(kSpot, kStrike, kTau, kRate, OptionType::CALL, kSigma));
    for (auto _ : state) {
        benchmark::DoNotOptimize(result.value());
        benchmark::DoNotOptimize(result.delta());
        benchmark::DoNotOptimize(result.vega());
        benchmark::DoNotOptimize(result.rho());
        benchmark::DoNotOptimize(result.theta());
    }
}
BENCHMARK(BM_Result_AllGreeks);

BENCHMARK_MAIN();
