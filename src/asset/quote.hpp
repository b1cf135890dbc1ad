// SPDX-License-Identifier: MIT
/**
 * @file quote.hpp
 * @brief Price quotes and last-quote bookkeeping for a listed asset
 */

#pragma once

#include "papaya/support/error_types.hpp"
#include <chrono>
#include <expected>
#include <ostream>
#include <string>
#include <vector>

namespace papaya {

struct Quote {
    using TimePoint = std::chrono::system_clock::time_point;

    TimePoint timestamp;
    double price = 0.0;
};

/// Prints Quote(date=YYYY-MM-DD HH:MM:SS, price=P)
std::ostream& operator<<(std::ostream& os, const Quote& quote);

/**
 * @brief Asset tracking its most recent quote plus every superseded one
 *
 * Quote updates follow three rules:
 * - negative prices are dropped and reported as QuoteErrorCode::NegativePrice
 * - quotes older than the last quote are filed into history (kept in
 *   timestamp order) and reported as QuoteErrorCode::PriorDate; the last
 *   quote is unchanged
 * - anything else pushes the current last quote to history and replaces it
 */
class QuotedAsset {
public:
    /// Construct without validating the initial quote
    QuotedAsset(std::string ticker, Quote last_quote, std::string currency);

    /// Factory rejecting a negative initial quote
    static std::expected<QuotedAsset, QuoteError>
    create(std::string ticker, Quote last_quote, std::string currency);

    std::expected<void, QuoteError> update_last_quote(const Quote& quote);

    const std::string& ticker() const { return ticker_; }
    const std::string& currency() const { return currency_; }
    const Quote& last_quote() const { return last_quote_; }

    /// Superseded and out-of-order quotes, oldest first
    const std::vector<Quote>& history() const { return history_; }

private:
    std::string ticker_;
    Quote last_quote_;
    std::string currency_;
    std::vector<Quote> history_;
};

}  // namespace papaya
