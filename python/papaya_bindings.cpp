// SPDX-License-Identifier: MIT
/**
 * @file papaya_bindings.cpp
 * @brief Python bindings for papaya European option pricing using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "papaya/math/black_scholes_analytics.hpp"
#include "papaya/option/european_option.hpp"
#include "papaya/option/option_spec.hpp"
#include <sstream>
#include <string>

namespace py = pybind11;

namespace {

std::string describe(const papaya::ValidationError& err) {
    std::ostringstream os;
    os << err;
    return os.str();
}

}  // namespace

PYBIND11_MODULE(papaya_option, m) {
    m.doc() = "Python bindings for papaya Black-Scholes European option pricing";

    // OptionType enum
    py::enum_<papaya::OptionType>(m, "OptionType")
        .value("CALL", papaya::OptionType::CALL)
        .value("PUT", papaya::OptionType::PUT);

    // GreekConventions structure
    py::class_<papaya::GreekConventions>(m, "GreekConventions")
        .def(py::init<>())
        .def_readwrite("days_per_year", &papaya::GreekConventions::days_per_year)
        .def_readwrite("rate_bump", &papaya::GreekConventions::rate_bump);

    // OptionSpec structure
    py::class_<papaya::OptionSpec>(m, "OptionSpec")
        .def(py::init<>())
        .def_readwrite("spot", &papaya::OptionSpec::spot)
        .def_readwrite("strike", &papaya::OptionSpec::strike)
        .def_readwrite("maturity", &papaya::OptionSpec::maturity)
        .def_readwrite("rate", &papaya::OptionSpec::rate)
        .def_readwrite("option_type", &papaya::OptionSpec::option_type);

    // PricingParams structure
    py::class_<papaya::PricingParams, papaya::OptionSpec>(m, "PricingParams")
        .def(py::init<>())
        .def(py::init<double, double, double, double, papaya::OptionType, double>(),
             py::arg("spot"), py::arg("strike"), py::arg("maturity"),
             py::arg("rate"), py::arg("option_type"), py::arg("volatility"))
        .def_readwrite("volatility", &papaya::PricingParams::volatility)
        .def("__repr__", [](const papaya::PricingParams& p) {
            return "<PricingParams spot=" + std::to_string(p.spot) +
                   " strike=" + std::to_string(p.strike) +
                   " maturity=" + std::to_string(p.maturity) +
                   " rate=" + std::to_string(p.rate) +
                   " type=" + (p.option_type == papaya::OptionType::CALL ? "CALL" : "PUT") +
                   " volatility=" + std::to_string(p.volatility) + ">";
        });

    // EuropeanOptionResult class
    py::class_<papaya::EuropeanOptionResult>(m, "EuropeanOptionResult")
        .def("value", &papaya::EuropeanOptionResult::value)
        .def("value_at", &papaya::EuropeanOptionResult::value_at, py::arg("spot"),
             "Option value at an arbitrary spot price")
        .def("d1", &papaya::EuropeanOptionResult::d1)
        .def("d2", &papaya::EuropeanOptionResult::d2)
        .def("delta", &papaya::EuropeanOptionResult::delta, "Compute delta (∂V/∂S)")
        .def("vega", &papaya::EuropeanOptionResult::vega, "Compute vega (∂V/∂σ)")
        .def("rho", &papaya::EuropeanOptionResult::rho, "Compute rho (∂V/∂r)")
        .def("rho_per_pct", &papaya::EuropeanOptionResult::rho_per_pct)
        .def("theta", &papaya::EuropeanOptionResult::theta, "Compute theta per year")
        .def("theta_per_day", &papaya::EuropeanOptionResult::theta_per_day)
        .def_property_readonly("params", &papaya::EuropeanOptionResult::params);

    // Validated pricing entry point
    m.def(
        "european_option",
        [](const papaya::PricingParams& params, const papaya::GreekConventions& conventions) {
            auto solver = papaya::EuropeanOptionSolver::create(params, conventions);
            if (!solver) {
                throw py::value_error(describe(solver.error()));
            }
            auto result = solver->solve();
            if (!result) {
                throw py::value_error("European option solve failed");
            }
            return *result;
        },
        py::arg("params"), py::arg("conventions") = papaya::GreekConventions{},
        "Validate parameters and return an EuropeanOptionResult; raises ValueError on invalid input");

    m.def("norm_pdf", &papaya::norm_pdf, py::arg("x"));
    m.def("norm_cdf", &papaya::norm_cdf, py::arg("x"));
    m.def("bs_price", &papaya::bs_price,
          py::arg("spot"), py::arg("strike"), py::arg("tau"),
          py::arg("sigma"), py::arg("rate"), py::arg("option_type"),
          "Closed-form Black-Scholes price (no dividends)");
    m.def("parity_forward", &papaya::parity_forward,
          py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("tau"),
          "Right-hand side of put-call parity: S - K·e^(-rT)");
}
