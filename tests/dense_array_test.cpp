// SPDX-License-Identifier: MIT

// tests/dense_array_test.cpp
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "pg_typemap/dense_array.hpp"

using namespace pg_typemap;

TEST(DenseArrayTest, DefaultIsEmpty) {
    DenseArray<int, 2> arr;
    EXPECT_TRUE(arr.empty());
    EXPECT_EQ(arr.size(), 0);
    EXPECT_EQ(arr.extent(0), 0);
    EXPECT_EQ(arr.extent(1), 0);
}

TEST(DenseArrayTest, FillConstructor) {
    DenseArray<int, 2> arr({2, 3}, 7);
    EXPECT_EQ(arr.rank(), 2);
    EXPECT_EQ(arr.size(), 6);
    EXPECT_EQ(arr(1, 2), 7);
}

TEST(DenseArrayTest, RowMajorLayout) {
    DenseArray<int, 2> arr({2, 3}, std::vector<int>{1, 2, 3, 4, 5, 6});
    EXPECT_EQ(arr(0, 0), 1);
    EXPECT_EQ(arr(0, 2), 3);
    EXPECT_EQ(arr(1, 0), 4);
    EXPECT_EQ(arr(1, 2), 6);
    EXPECT_EQ(arr.flat(4), 5);
}

TEST(DenseArrayTest, ElementWrite) {
    DenseArray<int, 2> arr({2, 2}, 0);
    arr(1, 0) = 42;
    EXPECT_EQ(arr.flat(2), 42);
}

TEST(DenseArrayTest, MismatchedDataThrows) {
    EXPECT_THROW((DenseArray<int, 2>({2, 2}, std::vector<int>{1, 2, 3})),
                 std::invalid_argument);
}

TEST(DenseArrayTest, OutOfRangeIndexThrows) {
    DenseArray<int, 2> arr({2, 2}, 0);
    EXPECT_THROW(arr(2, 0), std::out_of_range);
    EXPECT_THROW(arr(0, 2), std::out_of_range);
}

TEST(DenseArrayTest, Equality) {
    DenseArray<int, 1> a({3}, std::vector<int>{1, 2, 3});
    DenseArray<int, 1> b({3}, std::vector<int>{1, 2, 3});
    DenseArray<int, 1> c({3}, std::vector<int>{1, 2, 4});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(DenseArrayTest, SameElementsDifferentShapeNotEqual) {
    DenseArray<int, 2> a({2, 3}, std::vector<int>{1, 2, 3, 4, 5, 6});
    DenseArray<int, 2> b({3, 2}, std::vector<int>{1, 2, 3, 4, 5, 6});
    EXPECT_NE(a, b);
}
