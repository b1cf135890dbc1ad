// SPDX-License-Identifier: MIT
/**
 * @file example_quote_updates.cc
 * @brief Expected-based error handling for quotes, returns and cash accounts
 *
 * Demonstrates:
 * - Dropping a negative quote and continuing
 * - Filing an out-of-order quote into history
 * - Simple and log returns over a price series
 * - Guarded deposits/withdrawals and same-currency merging, including
 *   a cash position held as an asset
 */

#include "papaya/account/cash_account.hpp"
#include "papaya/asset/financial_asset.hpp"
#include "papaya/asset/quote.hpp"
#include "papaya/asset/returns.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <span>
#include <vector>

using namespace papaya;

namespace {

void update(QuotedAsset& asset, const Quote& quote) {
    auto result = asset.update_last_quote(quote);
    if (!result) {
        std::cout << result.error() << "\n";
        std::cout << "Quote has not been updated\n";
    }
}

void print_returns(const char* label, std::span<const double> prices, ReturnMethod method) {
    auto returns = compute_returns(prices, method);
    if (!returns) {
        std::cout << label << ": " << returns.error() << "\n";
        return;
    }
    std::cout << label << ":";
    for (double r : *returns) {
        std::cout << " " << std::fixed << std::setprecision(4) << r;
    }
    std::cout << "\n";
}

}  // namespace

int main() {
    using namespace std::chrono;
    auto now = system_clock::now();

    std::cout << "=== Quotes ===\n";
    auto equity = QuotedAsset::create("AAPL", Quote{now, 175.0}, "USD");
    if (!equity) {
        std::cerr << equity.error() << "\n";
        return 1;
    }
    update(*equity, Quote{now + seconds{1}, -200.0});
    update(*equity, Quote{now - days{1}, 172.5});
    update(*equity, Quote{now + minutes{5}, 176.1});
    std::cout << "Last: " << equity->last_quote() << "\n";
    for (const auto& q : equity->history()) {
        std::cout << "  history " << q << "\n";
    }

    std::cout << "\n=== Returns ===\n";
    std::vector<double> prices{100.0, 105.0, 103.0, 108.0};
    print_returns("Simple returns", prices, ReturnMethod::Simple);
    print_returns("Log returns", prices, ReturnMethod::Log);
    print_returns("Single price", std::span<const double>(prices).first(1), ReturnMethod::Simple);

    std::cout << "\n=== Cash accounts ===\n";
    CashAccount acc1("Account 1", 1200.0, "USD");
    CashAccount acc2("Account 2", 800.0, "USD");
    CashAccount acc3("Account 3", 50.0, "EUR");
    if (!acc1.deposit(500.0)) {
        std::cout << "Deposit refused\n";
    }
    if (!acc1.withdraw(10000.0)) {
        std::cout << "Withdrawal refused\n";
    }
    if (auto merged = acc1.merge(acc2)) {
        std::cout << "Merged balance: " << *merged << "\n";
    }
    if (auto merged = acc1.merge(acc3); !merged) {
        std::cout << "Merge refused: " << merged.error() << "\n";
    }
    FinancialAsset cash("USD", 300.0, "USD");
    if (auto merged = acc1.merge(cash)) {
        std::cout << "After crediting USD cash: " << *merged << "\n";
    }
    std::cout << acc1 << "\n";

    return 0;
}
