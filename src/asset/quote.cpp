// SPDX-License-Identifier: MIT
#include "papaya/asset/quote.hpp"
#include "papaya/support/papaya_trace.h"
#include <algorithm>
#include <format>
#include <utility>

namespace papaya {

std::ostream& operator<<(std::ostream& os, const Quote& quote) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(quote.timestamp);
    os << std::format("Quote(date={:%Y-%m-%d %H:%M:%S}, price={})", seconds, quote.price);
    return os;
}

QuotedAsset::QuotedAsset(std::string ticker, Quote last_quote, std::string currency)
    : ticker_(std::move(ticker))
    , last_quote_(last_quote)
    , currency_(std::move(currency))
{}

std::expected<QuotedAsset, QuoteError>
QuotedAsset::create(std::string ticker, Quote last_quote, std::string currency) {
    if (last_quote.price < 0.0) {
        PAPAYA_TRACE_QUOTE_REJECTED(last_quote.price);
        return std::unexpected(QuoteError{QuoteErrorCode::NegativePrice, last_quote.price});
    }
    return QuotedAsset(std::move(ticker), last_quote, std::move(currency));
}

std::expected<void, QuoteError> QuotedAsset::update_last_quote(const Quote& quote) {
    if (quote.price < 0.0) {
        PAPAYA_TRACE_QUOTE_REJECTED(quote.price);
        return std::unexpected(QuoteError{QuoteErrorCode::NegativePrice, quote.price});
    }

    if (quote.timestamp < last_quote_.timestamp) {
        auto pos = std::upper_bound(
            history_.begin(), history_.end(), quote.timestamp,
            [](const Quote::TimePoint& t, const Quote& q) { return t < q.timestamp; });
        history_.insert(pos, quote);
        PAPAYA_TRACE_QUOTE_OUT_OF_ORDER(quote.price, history_.size());
        return std::unexpected(QuoteError{QuoteErrorCode::PriorDate, quote.price});
    }

    history_.push_back(last_quote_);
    last_quote_ = quote;
    return {};
}

}  // namespace papaya
