// SPDX-License-Identifier: MIT
/**
 * @file indexed_list.hpp
 * @brief Sequence container keyed by position in an ordered map
 *
 * Elements live in a std::map<size_t, T> under keys 0..size()-1. Removing
 * an element shifts every later key down by one, so positional operations
 * are linear. There is no capacity management.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace papaya {

template <typename T>
class IndexedList {
public:
    IndexedList() = default;

    void append(T element) {
        elements_.emplace(count_, std::move(element));
        ++count_;
    }

    /// Remove the first element equal to value. Returns false if absent.
    bool remove(const T& value) {
        auto index = index_of(value);
        if (!index.has_value()) {
            return false;
        }
        take(*index);
        return true;
    }

    /// Remove and return the element at index
    /// @throws std::out_of_range if index >= size()
    T pop(size_t index) {
        check_index(index);
        return take(index);
    }

    /// Position of the first element equal to value
    std::optional<size_t> index_of(const T& value) const {
        for (const auto& [index, element] : elements_) {
            if (element == value) {
                return index;
            }
        }
        return std::nullopt;
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    /// @throws std::out_of_range if index >= size()
    const T& operator[](size_t index) const {
        check_index(index);
        return elements_.at(index);
    }

    /// @throws std::out_of_range if index >= size()
    T& operator[](size_t index) {
        check_index(index);
        return elements_.at(index);
    }

    /// Concatenation: elements of *this followed by elements of other
    IndexedList operator+(const IndexedList& other) const {
        IndexedList result = *this;
        for (const auto& [index, element] : other.elements_) {
            result.append(element);
        }
        return result;
    }

    bool operator==(const IndexedList& other) const {
        return count_ == other.count_ && elements_ == other.elements_;
    }

    /// "[a, b, c]" using operator<< on each element
    std::string to_string() const {
        std::ostringstream os;
        os << '[';
        for (size_t i = 0; i < count_; ++i) {
            if (i > 0) {
                os << ", ";
            }
            os << elements_.at(i);
        }
        os << ']';
        return os.str();
    }

private:
    void check_index(size_t index) const {
        if (index >= count_) {
            throw std::out_of_range("Out of bound index");
        }
    }

    // Extract the element at index and close the gap
    T take(size_t index) {
        auto node = elements_.extract(index);
        T element = std::move(node.mapped());
        --count_;
        for (size_t i = index; i < count_; ++i) {
            auto next = elements_.extract(i + 1);
            next.key() = i;
            elements_.insert(std::move(next));
        }
        return element;
    }

    std::map<size_t, T> elements_;
    size_t count_ = 0;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const IndexedList<T>& list) {
    return os << list.to_string();
}

}  // namespace papaya
