// SPDX-License-Identifier: MIT
/**
 * @file financial_asset.hpp
 * @brief Asset hierarchy: generic asset, equity, bond and Black-Scholes option
 *
 * FinancialAsset is the polymorphic base; price(), kind() and description()
 * dispatch to the dynamic type so heterogeneous collections can be printed
 * and valued through a base pointer.
 */

#pragma once

#include "papaya/option/option_spec.hpp"
#include "papaya/option/european_option.hpp"
#include "papaya/support/error_types.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace papaya {

class FinancialAsset {
public:
    FinancialAsset(std::string ticker, double price, std::string currency);
    virtual ~FinancialAsset() = default;

    const std::string& ticker() const { return ticker_; }
    const std::string& currency() const { return currency_; }

    /// Current price in currency units
    virtual double price() const { return price_; }

    /// Name of the dynamic type ("FinancialAsset", "Equity", ...)
    virtual std::string kind() const { return "FinancialAsset"; }

    /// One-line human readable summary
    virtual std::string description() const;

protected:
    FinancialAsset(const FinancialAsset&) = default;
    FinancialAsset& operator=(const FinancialAsset&) = default;

private:
    std::string ticker_;
    double price_;
    std::string currency_;
};

/**
 * @brief Listed equity with earnings per share
 *
 * Unknown or non-positive EPS makes the P/E ratio meaningless; pe_ratio()
 * reports 0 in that case.
 */
class Equity : public FinancialAsset {
public:
    Equity(std::string ticker, double price, std::string currency,
           std::optional<double> eps);

    std::optional<double> eps() const { return eps_; }

    /// Price / EPS, or 0 when EPS is unknown or non-positive
    double pe_ratio() const;

    std::string kind() const override { return "Equity"; }
    std::string description() const override;

private:
    std::optional<double> eps_;
};

class Bond : public FinancialAsset {
public:
    Bond(std::string ticker, double price, std::string currency,
         std::chrono::sys_days maturity_date, double coupon_rate);

    std::chrono::sys_days maturity_date() const { return maturity_date_; }
    double coupon_rate() const { return coupon_rate_; }

    /// Whole calendar days from as_of to maturity divided by 365.
    /// Negative once the bond has matured.
    double time_to_maturity(std::chrono::sys_days as_of) const;

    /// Maturity (midnight UTC) minus now, floored to whole days, over 365.
    /// A partially elapsed day counts as gone.
    double time_to_maturity(std::chrono::system_clock::time_point now) const;

    /// time_to_maturity(system_clock::now())
    double time_to_maturity() const;

    std::string kind() const override { return "Bond"; }
    std::string description() const override;

private:
    std::chrono::sys_days maturity_date_;
    double coupon_rate_;
};

/**
 * @brief European option held as an asset, priced with Black-Scholes
 *
 * The quoted price is recomputed from the parameters on every call.
 */
class OptionAsset : public FinancialAsset {
public:
    /// Construct without validation
    OptionAsset(std::string ticker, std::string currency, const PricingParams& params);

    /// Factory with validation via validate_pricing_params()
    static std::expected<OptionAsset, ValidationError>
    create(std::string ticker, std::string currency, const PricingParams& params);

    double price() const override;
    std::string kind() const override;
    std::string description() const override;

    const PricingParams& params() const { return params_; }

    /// Full closed-form result (Greeks included)
    EuropeanOptionResult pricing() const { return EuropeanOptionResult(params_); }

private:
    PricingParams params_;
};

}  // namespace papaya
