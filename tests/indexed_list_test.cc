// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "papaya/container/indexed_list.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace papaya {
namespace {

template <typename L, typename R>
concept Addable = requires(const L& lhs, const R& rhs) { lhs + rhs; };

static_assert(Addable<IndexedList<int>, IndexedList<int>>);
static_assert(!Addable<IndexedList<int>, std::vector<int>>,
              "only another IndexedList can be concatenated");
static_assert(!Addable<IndexedList<int>, int>);

class IndexedListTest : public ::testing::Test {
protected:
    void SetUp() override {
        list_.append(1);
        list_.append(2);
        list_.append(3);
    }

    IndexedList<int> list_;
};

TEST_F(IndexedListTest, ToString) {
    EXPECT_EQ(list_.to_string(), "[1, 2, 3]");
    EXPECT_EQ(IndexedList<int>().to_string(), "[]");
}

TEST_F(IndexedListTest, Size) {
    EXPECT_EQ(list_.size(), 3u);
    EXPECT_FALSE(list_.empty());
}

TEST_F(IndexedListTest, Subscript) {
    EXPECT_EQ(list_[1], 2);
    EXPECT_THROW(list_[3], std::out_of_range);
}

TEST_F(IndexedListTest, SubscriptAssign) {
    list_[1] = 5;
    EXPECT_EQ(list_[1], 5);
    EXPECT_THROW(list_[3] = 4, std::out_of_range);
}

TEST_F(IndexedListTest, Concatenation) {
    IndexedList<int> other;
    other.append(4);
    other.append(5);
    auto result = list_ + other;
    EXPECT_EQ(result.to_string(), "[1, 2, 3, 4, 5]");

    // Operands unchanged
    EXPECT_EQ(list_.size(), 3u);
    EXPECT_EQ(other.size(), 2u);
}

TEST_F(IndexedListTest, RemoveFirstOccurrenceShiftsTail) {
    list_.append(2);
    EXPECT_TRUE(list_.remove(2));
    EXPECT_EQ(list_.to_string(), "[1, 3, 2]");
    EXPECT_EQ(list_[1], 3);
    EXPECT_FALSE(list_.remove(42));
    EXPECT_EQ(list_.size(), 3u);
}

TEST_F(IndexedListTest, Pop) {
    EXPECT_EQ(list_.pop(0), 1);
    EXPECT_EQ(list_.to_string(), "[2, 3]");
    EXPECT_EQ(list_.pop(1), 3);
    EXPECT_EQ(list_.size(), 1u);
    EXPECT_THROW(list_.pop(1), std::out_of_range);
}

TEST_F(IndexedListTest, IndexOf) {
    EXPECT_EQ(list_.index_of(3), 2u);
    EXPECT_FALSE(list_.index_of(7).has_value());
}

TEST_F(IndexedListTest, AppendAfterPopReusesPositions) {
    list_.pop(1);
    list_.append(9);
    EXPECT_EQ(list_.to_string(), "[1, 3, 9]");
    EXPECT_EQ(list_[2], 9);
}

TEST_F(IndexedListTest, Equality) {
    IndexedList<int> same;
    same.append(1);
    same.append(2);
    same.append(3);
    EXPECT_TRUE(list_ == same);
    same[2] = 4;
    EXPECT_FALSE(list_ == same);
}

TEST(IndexedListStringTest, HoldsStringsAndStreams) {
    IndexedList<std::string> tickers;
    tickers.append("AAPL");
    tickers.append("MSFT");
    std::ostringstream os;
    os << tickers;
    EXPECT_EQ(os.str(), "[AAPL, MSFT]");
    EXPECT_EQ(tickers.pop(0), "AAPL");
    EXPECT_EQ(tickers.index_of("MSFT"), 0u);
}

}  // namespace
}  // namespace papaya
