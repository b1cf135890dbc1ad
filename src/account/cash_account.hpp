// SPDX-License-Identifier: MIT
/**
 * @file cash_account.hpp
 * @brief Single-currency cash account with a transaction log
 */

#pragma once

#include "papaya/support/error_types.hpp"
#include <expected>
#include <ostream>
#include <string>
#include <vector>

namespace papaya {

class FinancialAsset;

/**
 * @brief Cash balance owned by one holder in one currency
 *
 * The balance is only reachable through deposit(), withdraw() and the
 * same-currency merge/offset operations; every accepted movement is
 * appended to the transaction log.
 *
 * merge() and offset() also take a cash position held as an asset: one
 * whose ticker is the account currency (e.g. FinancialAsset("USD", 300,
 * "USD")). Its price is credited or debited.
 */
class CashAccount {
public:
    CashAccount(std::string owner, double initial_balance, std::string currency);

    /// Accepts strictly positive amounts only
    bool deposit(double amount);

    /// Accepts 0 < amount <= balance only
    bool withdraw(double amount);

    /// Add other's balance; currencies must match. Returns the new balance.
    std::expected<double, ValidationError> merge(const CashAccount& other);

    /// Subtract other's balance; currencies must match. Returns the new balance.
    std::expected<double, ValidationError> offset(const CashAccount& other);

    /// Credit a cash position; asset.ticker() must equal currency()
    std::expected<double, ValidationError> merge(const FinancialAsset& cash);

    /// Debit a cash position; asset.ticker() must equal currency()
    std::expected<double, ValidationError> offset(const FinancialAsset& cash);

    const std::string& owner() const { return owner_; }
    const std::string& currency() const { return currency_; }
    double balance() const { return balance_; }
    const std::vector<std::string>& transactions() const { return transactions_; }

    /// "Bank account owner is O and the balance is B C"
    std::string to_string() const;

private:
    void record(std::string entry);

    std::string owner_;
    double balance_;
    std::string currency_;
    std::vector<std::string> transactions_;
};

std::ostream& operator<<(std::ostream& os, const CashAccount& account);

}  // namespace papaya
