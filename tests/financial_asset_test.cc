// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "papaya/asset/financial_asset.hpp"
#include "papaya/asset/priceable.hpp"
#include <chrono>
#include <memory>
#include <vector>

namespace papaya {
namespace {

using namespace std::chrono;

TEST(FinancialAssetTest, Description) {
    FinancialAsset asset("AAPL", 230.0, "USD");
    EXPECT_EQ(asset.description(), "FinancialAsset : ticker = AAPL / price = 230 USD");
    EXPECT_EQ(asset.kind(), "FinancialAsset");
    EXPECT_DOUBLE_EQ(asset.price(), 230.0);
}

TEST(EquityTest, PeRatio) {
    Equity equity("AAPL", 230.0, "USD", 6.1);
    EXPECT_NEAR(equity.pe_ratio(), 37.70, 0.01);
    EXPECT_EQ(equity.ticker(), "AAPL");
}

TEST(EquityTest, PeRatioZeroWithoutMeaningfulEps) {
    EXPECT_DOUBLE_EQ(Equity("AAPL", 230.0, "USD", std::nullopt).pe_ratio(), 0.0);
    EXPECT_DOUBLE_EQ(Equity("AAPL", 230.0, "USD", 0.0).pe_ratio(), 0.0);
    EXPECT_DOUBLE_EQ(Equity("AAPL", 230.0, "USD", -1.5).pe_ratio(), 0.0);
}

TEST(EquityTest, DescriptionOverridesBase) {
    std::unique_ptr<FinancialAsset> asset =
        std::make_unique<Equity>("AAPL", 230.0, "USD", std::nullopt);
    EXPECT_EQ(asset->description(), "Equity : ticker = AAPL / price = 230 USD / pe = 0");
    EXPECT_EQ(asset->kind(), "Equity");
}

TEST(BondTest, TimeToMaturityFromDate) {
    Bond bond("US10YT", 97.0, "USD", sys_days{year{2030} / 12 / 31}, 0.0405);
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(sys_days{year{2029} / 12 / 31}), 1.0);
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(sys_days{year{2030} / 12 / 31}), 0.0);
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(sys_days{year{2031} / 1 / 31}), -31.0 / 365.0);
}

TEST(BondTest, TimeToMaturityFromInstantDropsPartialDay) {
    Bond bond("US10YT", 97.0, "USD", sys_days{year{2030} / 12 / 31}, 0.0405);
    system_clock::time_point midday = sys_days{year{2029} / 12 / 31} + hours{12};
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(midday), 364.0 / 365.0);

    system_clock::time_point midnight = sys_days{year{2029} / 12 / 31};
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(midnight), 1.0);

    // Matured half a day ago: floors to -1 day
    system_clock::time_point after = sys_days{year{2030} / 12 / 31} + hours{12};
    EXPECT_DOUBLE_EQ(bond.time_to_maturity(after), -1.0 / 365.0);
}

TEST(BondTest, TimeToMaturityFromClock) {
    auto today = floor<days>(system_clock::now());
    Bond bond("US10YT", 97.0, "USD", today + days{730}, 0.0405);
    // 729 days once any part of today has elapsed; 728 after a midnight rollover
    double ttm = bond.time_to_maturity();
    EXPECT_GE(ttm, 728.0 / 365.0);
    EXPECT_LE(ttm, 730.0 / 365.0);
}

TEST(BondTest, Description) {
    Bond bond("US10YT", 97.0, "USD", sys_days{year{2030} / 12 / 31}, 0.0405);
    EXPECT_EQ(bond.description(),
              "Bond : ticker = US10YT / price = 97 USD / coupon = 0.0405 / maturity = 2030-12-31");
    EXPECT_DOUBLE_EQ(bond.coupon_rate(), 0.0405);
}

TEST(OptionAssetTest, PricedWithBlackScholes) {
    OptionAsset call("AAPL C90", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.2));
    OptionAsset put("AAPL P90", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::PUT, 0.2));
    EXPECT_NEAR(call.price(), 16.699448, 1e-5);
    EXPECT_NEAR(put.price(), 2.310097, 1e-5);
    EXPECT_EQ(call.kind(), "Call");
    EXPECT_EQ(put.kind(), "Put");
    EXPECT_NEAR(call.pricing().delta(), 0.809703, 1e-6);
}

TEST(OptionAssetTest, CreateValidates) {
    auto bad = OptionAsset::create("X", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.0));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidVolatility);

    auto good = OptionAsset::create("X", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.2));
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(good->ticker(), "X");
}

TEST(PolymorphismTest, PricesThroughBasePointer) {
    std::vector<std::unique_ptr<FinancialAsset>> assets;
    assets.push_back(std::make_unique<FinancialAsset>("STOCK", 100.0, "USD"));
    assets.push_back(std::make_unique<OptionAsset>(
        "CALL", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.2)));
    assets.push_back(std::make_unique<OptionAsset>(
        "PUT", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::PUT, 0.2)));

    std::vector<std::string> kinds;
    for (const auto& a : assets) {
        kinds.push_back(a->kind());
    }
    EXPECT_EQ(kinds, (std::vector<std::string>{"FinancialAsset", "Call", "Put"}));
    EXPECT_NEAR(total_value(assets), 100.0 + 16.699448 + 2.310097, 1e-5);
}

// Satisfies Priceable structurally, no inheritance
struct StockQuote {
    double price_per_share;
    double price() const { return price_per_share; }
};

struct NotPriceable {
    double value;
};

static_assert(Priceable<StockQuote>);
static_assert(Priceable<Equity>);
static_assert(!Priceable<NotPriceable>);
static_assert(PriceableHandle<std::unique_ptr<FinancialAsset>>);
static_assert(PriceableHandle<const OptionAsset*>);

TEST(PriceableTest, TotalValueOverStructuralTypes) {
    std::vector<StockQuote> quotes{{150.0}, {50.5}};
    EXPECT_DOUBLE_EQ(total_value(quotes), 200.5);
    EXPECT_DOUBLE_EQ(total_value(std::vector<StockQuote>{}), 0.0);
}

TEST(PriceableTest, TotalValueOverRawPointers) {
    StockQuote a{150.0};
    OptionAsset call("C", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.2));
    std::vector<const StockQuote*> quotes{&a};
    std::vector<const OptionAsset*> options{&call};
    EXPECT_NEAR(total_value(quotes) + total_value(options), 150.0 + 16.699448, 1e-5);
}

}  // namespace
}  // namespace papaya
