// SPDX-License-Identifier: MIT
/**
 * @file example_indexed_list.cc
 * @brief IndexedList operations: append, subscript, pop, remove, concatenation
 */

#include "papaya/container/indexed_list.hpp"
#include <iostream>
#include <stdexcept>

using papaya::IndexedList;

int main() {
    IndexedList<int> list;
    list.append(1);
    list.append(2);
    list.append(3);
    std::cout << list << " (size " << list.size() << ")\n";

    list[1] = 5;
    std::cout << "after list[1] = 5: " << list << "\n";

    try {
        std::cout << list[3] << "\n";
    } catch (const std::out_of_range& e) {
        std::cout << "list[3]: " << e.what() << "\n";
    }

    IndexedList<int> other;
    other.append(4);
    other.append(5);
    auto joined = list + other;
    std::cout << list << " + " << other << " = " << joined << "\n";

    bool removed = joined.remove(5);
    std::cout << "remove(5) -> " << std::boolalpha << removed << ", now " << joined << "\n";
    std::cout << "pop(0) -> " << joined.pop(0) << ", now " << joined << "\n";

    if (auto idx = joined.index_of(4)) {
        std::cout << "index_of(4) = " << *idx << "\n";
    }

    return 0;
}
