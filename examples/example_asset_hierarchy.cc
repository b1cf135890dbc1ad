// SPDX-License-Identifier: MIT
/**
 * @file example_asset_hierarchy.cc
 * @brief Asset hierarchy, virtual dispatch and structural pricing
 */

#include "papaya/asset/financial_asset.hpp"
#include "papaya/asset/priceable.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <vector>

using namespace papaya;

namespace {

void print_asset_price(const FinancialAsset& asset) {
    std::cout << "The price of the " << asset.kind() << " is: "
              << std::fixed << std::setprecision(2) << asset.price() << "\n";
}

// Not part of the hierarchy; priced through the Priceable concept only
struct StockPricable {
    std::string symbol;
    double price_per_share;

    double price() const { return price_per_share; }
};

}  // namespace

int main() {
    using namespace std::chrono;

    FinancialAsset asset("AAPL", 230.0, "USD");
    std::cout << asset.description() << "\n";

    Equity equity("AAPL", 230.0, "USD", 6.1);
    std::cout << equity.description() << "\n";
    std::cout << "PE ratio for " << equity.ticker() << " : "
              << std::fixed << std::setprecision(2) << equity.pe_ratio() << "\n";

    Bond bond("US10YT", 97.0, "USD", sys_days{year{2030} / 12 / 31}, 0.0405);
    std::cout << "ttm for bond " << bond.time_to_maturity() << "\n\n";

    std::vector<std::unique_ptr<FinancialAsset>> book;
    book.push_back(std::make_unique<FinancialAsset>("STOCK", 100.0, "USD"));
    book.push_back(std::make_unique<OptionAsset>(
        "CALL90", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::CALL, 0.2)));
    book.push_back(std::make_unique<OptionAsset>(
        "PUT90", "USD", PricingParams(100.0, 90.0, 1.0, 0.05, OptionType::PUT, 0.2)));

    for (const auto& a : book) {
        print_asset_price(*a);
    }

    std::vector<StockPricable> stocks{{"AAPL", 150.0}};
    double total = total_value(stocks) + total_value(book);
    std::cout << "Total Value: $" << total << "\n";

    return 0;
}
