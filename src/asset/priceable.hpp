// SPDX-License-Identifier: MIT
/**
 * @file priceable.hpp
 * @brief Structural interface for anything that reports a price
 *
 * Types satisfy Priceable without inheriting from FinancialAsset: any
 * price() returning something convertible to double is enough.
 */

#pragma once

#include <concepts>
#include <ranges>
#include <type_traits>

namespace papaya {

template <typename T>
concept Priceable = requires(const T& t) {
    { t.price() } -> std::convertible_to<double>;
};

/// Priceable value, or pointer/smart pointer to one
template <typename T>
concept PriceableHandle = Priceable<T> || requires(const T& t) {
    requires Priceable<std::remove_cvref_t<decltype(*t)>>;
};

/// Sum of price() over a range of priceables or handles to them
template <std::ranges::input_range R>
    requires PriceableHandle<std::ranges::range_value_t<R>>
double total_value(const R& assets) {
    double total = 0.0;
    for (const auto& asset : assets) {
        if constexpr (Priceable<std::ranges::range_value_t<R>>) {
            total += asset.price();
        } else {
            total += (*asset).price();
        }
    }
    return total;
}

}  // namespace papaya
