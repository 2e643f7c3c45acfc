// SPDX-License-Identifier: MIT

// tests/array/array_mapping_cache_test.cpp
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "pg_typemap/array/array_mapping_cache.hpp"
#include "pg_typemap/pg/scalar_mapping.hpp"

using namespace pg_typemap;

TEST(ArrayMappingCacheTest, ReturnsSameInstanceForSameKey) {
    ArrayMappingCache cache;
    auto element = pg::make_default_mapping<int32_t>();

    auto first = cache.get_or_create<std::vector<int32_t>>(element);
    auto second = cache.get_or_create<std::vector<int32_t>>(element);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ(cache.size(), 1);
}

TEST(ArrayMappingCacheTest, SequenceTypeIsPartOfKey) {
    ArrayMappingCache cache;
    auto element = pg::make_default_mapping<int32_t>();

    auto vec = cache.get_or_create<std::vector<int32_t>>(element);
    auto opt = cache.get_or_create<std::vector<std::optional<int32_t>>>(element);
    ASSERT_TRUE(vec.has_value());
    ASSERT_TRUE(opt.has_value());
    EXPECT_EQ((*vec)->store_type(), (*opt)->store_type());
    EXPECT_EQ(cache.size(), 2);
}

TEST(ArrayMappingCacheTest, StoreTypeIsPartOfKey) {
    ArrayMappingCache cache;
    auto element = pg::make_default_mapping<int32_t>();

    auto plain = cache.get_or_create<std::vector<int32_t>>(element);
    auto renamed = cache.get_or_create<std::vector<int32_t>>(element, "int4[]");
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(renamed.has_value());
    EXPECT_NE(plain->get(), renamed->get());
    EXPECT_EQ((*renamed)->store_type(), "int4[]");
    EXPECT_EQ(cache.size(), 2);
}

TEST(ArrayMappingCacheTest, FailuresAreNotCached) {
    ArrayMappingCache cache;
    auto text = pg::make_default_mapping<std::string>();

    auto result = cache.get_or_create<std::vector<int32_t>>(text);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedShape);
    EXPECT_EQ(cache.size(), 0);

    auto missing = cache.get_or_create<std::vector<int32_t>>(nullptr);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::UnsupportedShape);
}

TEST(ArrayMappingCacheTest, Clear) {
    ArrayMappingCache cache;
    auto element = pg::make_default_mapping<int32_t>();

    auto first = cache.get_or_create<std::vector<int32_t>>(element);
    ASSERT_TRUE(first.has_value());
    cache.clear();
    EXPECT_EQ(cache.size(), 0);

    auto second = cache.get_or_create<std::vector<int32_t>>(element);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->get(), second->get());
    // The evicted mapping still works for holders.
    EXPECT_TRUE(*(*first)->equals({1}, {1}));
}

TEST(ArrayMappingCacheTest, ConcurrentCallersShareOneMapping) {
    ArrayMappingCache cache;
    auto element = pg::make_default_mapping<double>();

    constexpr int kThreads = 8;
    std::vector<const ArrayTypeMapping<std::vector<double>>*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto mapping = cache.get_or_create<std::vector<double>>(element);
            if (mapping) {
                seen[i] = mapping->get();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(cache.size(), 1);
    for (int i = 0; i < kThreads; ++i) {
        ASSERT_NE(seen[i], nullptr);
        EXPECT_EQ(seen[i], seen[0]);
    }
}
