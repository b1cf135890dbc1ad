// SPDX-License-Identifier: MIT
#include "papaya/option/option_spec.hpp"
#include "papaya/support/papaya_trace.h"
#include <cmath>

namespace papaya {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    PAPAYA_TRACE_VALIDATION_ERROR(MODULE_VALIDATION, static_cast<int>(code), value, 0.0);
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<void, ValidationError> validate_option_spec(const OptionSpec& spec) {
    if (spec.spot <= 0.0 || !std::isfinite(spec.spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, spec.spot);
    }

    if (spec.strike <= 0.0 || !std::isfinite(spec.strike)) {
        return reject(ValidationErrorCode::InvalidStrike, spec.strike);
    }

    if (spec.maturity <= 0.0 || !std::isfinite(spec.maturity)) {
        return reject(ValidationErrorCode::InvalidMaturity, spec.maturity);
    }

    // Negative rates are allowed
    if (!std::isfinite(spec.rate)) {
        return reject(ValidationErrorCode::InvalidRate, spec.rate);
    }

    return {};
}

std::expected<void, ValidationError> validate_pricing_params(const PricingParams& params) {
    // Validate base option spec first (using slicing)
    auto spec_validation = validate_option_spec(static_cast<const OptionSpec&>(params));
    if (!spec_validation) {
        return spec_validation;
    }

    if (params.volatility <= 0.0 || !std::isfinite(params.volatility)) {
        return reject(ValidationErrorCode::InvalidVolatility, params.volatility);
    }

    return {};
}

} // namespace papaya
