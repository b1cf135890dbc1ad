// SPDX-License-Identifier: MIT
#include "papaya/asset/financial_asset.hpp"
#include <format>
#include <utility>

namespace papaya {

namespace {

constexpr double kDaysPerYear = 365.0;

}  // namespace

// ===========================================================================
// FinancialAsset
// ===========================================================================

FinancialAsset::FinancialAsset(std::string ticker, double price, std::string currency)
    : ticker_(std::move(ticker))
    , price_(price)
    , currency_(std::move(currency))
{}

std::string FinancialAsset::description() const {
    return std::format("FinancialAsset : ticker = {} / price = {} {}",
                       ticker(), price(), currency());
}

// ===========================================================================
// Equity
// ===========================================================================

Equity::Equity(std::string ticker, double price, std::string currency,
               std::optional<double> eps)
    : FinancialAsset(std::move(ticker), price, std::move(currency))
    , eps_(eps)
{}

double Equity::pe_ratio() const {
    if (!eps_.has_value() || *eps_ <= 0.0) {
        return 0.0;
    }
    return price() / *eps_;
}

std::string Equity::description() const {
    return std::format("Equity : ticker = {} / price = {} {} / pe = {}",
                       ticker(), price(), currency(), pe_ratio());
}

// ===========================================================================
// Bond
// ===========================================================================

Bond::Bond(std::string ticker, double price, std::string currency,
           std::chrono::sys_days maturity_date, double coupon_rate)
    : FinancialAsset(std::move(ticker), price, std::move(currency))
    , maturity_date_(maturity_date)
    , coupon_rate_(coupon_rate)
{}

double Bond::time_to_maturity(std::chrono::sys_days as_of) const {
    auto days = (maturity_date_ - as_of).count();
    return static_cast<double>(days) / kDaysPerYear;
}

double Bond::time_to_maturity(std::chrono::system_clock::time_point now) const {
    auto days = std::chrono::floor<std::chrono::days>(maturity_date_ - now).count();
    return static_cast<double>(days) / kDaysPerYear;
}

double Bond::time_to_maturity() const {
    return time_to_maturity(std::chrono::system_clock::now());
}

std::string Bond::description() const {
    return std::format("Bond : ticker = {} / price = {} {} / coupon = {} / maturity = {:%Y-%m-%d}",
                       ticker(), price(), currency(), coupon_rate_, maturity_date_);
}

// ===========================================================================
// OptionAsset
// ===========================================================================

OptionAsset::OptionAsset(std::string ticker, std::string currency, const PricingParams& params)
    : FinancialAsset(std::move(ticker), 0.0, std::move(currency))
    , params_(params)
{}

std::expected<OptionAsset, ValidationError>
OptionAsset::create(std::string ticker, std::string currency, const PricingParams& params) {
    auto validation = validate_pricing_params(params);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return OptionAsset(std::move(ticker), std::move(currency), params);
}

double OptionAsset::price() const {
    return pricing().value();
}

std::string OptionAsset::kind() const {
    return params_.option_type == OptionType::PUT ? "Put" : "Call";
}

std::string OptionAsset::description() const {
    return std::format("{} : ticker = {} / price = {:.2f} {} / K = {} / T = {} / vol = {}",
                       kind(), ticker(), price(), currency(),
                       params_.strike, params_.maturity, params_.volatility);
}

}  // namespace papaya
