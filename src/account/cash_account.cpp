// SPDX-License-Identifier: MIT
#include "papaya/account/cash_account.hpp"
#include "papaya/asset/financial_asset.hpp"
#include "papaya/support/papaya_trace.h"
#include <format>
#include <utility>

namespace papaya {

namespace {

std::unexpected<ValidationError> reject_currency(double amount, double balance) {
    PAPAYA_TRACE_VALIDATION_ERROR(MODULE_ACCOUNT,
                                  static_cast<int>(ValidationErrorCode::InvalidCurrency),
                                  amount, balance);
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidCurrency, amount));
}

}  // namespace

CashAccount::CashAccount(std::string owner, double initial_balance, std::string currency)
    : owner_(std::move(owner))
    , balance_(initial_balance)
    , currency_(std::move(currency))
{}

bool CashAccount::deposit(double amount) {
    if (!(amount > 0.0)) {
        PAPAYA_TRACE_VALIDATION_ERROR(MODULE_ACCOUNT,
                                      static_cast<int>(ValidationErrorCode::InvalidAmount),
                                      amount, balance_);
        return false;
    }
    balance_ += amount;
    record(std::format("Deposit of {}", amount));
    return true;
}

bool CashAccount::withdraw(double amount) {
    if (!(amount > 0.0) || amount > balance_) {
        PAPAYA_TRACE_VALIDATION_ERROR(MODULE_ACCOUNT,
                                      static_cast<int>(ValidationErrorCode::InvalidAmount),
                                      amount, balance_);
        return false;
    }
    balance_ -= amount;
    record(std::format("Withdrawal of {}", amount));
    return true;
}

std::expected<double, ValidationError> CashAccount::merge(const CashAccount& other) {
    // Read before mutating: other may be *this
    const double amount = other.balance_;
    if (other.currency_ != currency_) {
        return reject_currency(amount, balance_);
    }
    balance_ += amount;
    record(std::format("Merge of {} from {}", amount, other.owner_));
    return balance_;
}

std::expected<double, ValidationError> CashAccount::offset(const CashAccount& other) {
    const double amount = other.balance_;
    if (other.currency_ != currency_) {
        return reject_currency(amount, balance_);
    }
    balance_ -= amount;
    record(std::format("Offset of {} against {}", amount, other.owner_));
    return balance_;
}

std::expected<double, ValidationError> CashAccount::merge(const FinancialAsset& cash) {
    const double amount = cash.price();
    if (cash.ticker() != currency_) {
        return reject_currency(amount, balance_);
    }
    balance_ += amount;
    record(std::format("Merge of {} from {}", amount, cash.ticker()));
    return balance_;
}

std::expected<double, ValidationError> CashAccount::offset(const FinancialAsset& cash) {
    const double amount = cash.price();
    if (cash.ticker() != currency_) {
        return reject_currency(amount, balance_);
    }
    balance_ -= amount;
    record(std::format("Offset of {} against {}", amount, cash.ticker()));
    return balance_;
}

std::string CashAccount::to_string() const {
    return std::format("Bank account owner is {} and the balance is {} {}",
                       owner_, balance_, currency_);
}

void CashAccount::record(std::string entry) {
    transactions_.push_back(std::move(entry));
}

std::ostream& operator<<(std::ostream& os, const CashAccount& account) {
    return os << account.to_string();
}

}  // namespace papaya
