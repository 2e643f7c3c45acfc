// SPDX-License-Identifier: MIT

// tests/value_comparer_test.cpp
#include <gtest/gtest.h>

#include <any>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <typeindex>

#include "pg_typemap/value_comparer.hpp"

using namespace pg_typemap;

namespace {

// Case-insensitive comparer, enough to tell comparer semantics apart from
// operator==.
class CaseInsensitiveComparer : public ValueComparer<std::string> {
public:
    bool equals(const std::string& a, const std::string& b) const override {
        return fold(a) == fold(b);
    }
    std::size_t hash(const std::string& value) const override {
        return std::hash<std::string>{}(fold(value));
    }
    std::string snapshot(const std::string& source) const override { return source; }

private:
    static std::string fold(std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }
};

}  // namespace

TEST(HashCombineTest, OrderSensitive) {
    EXPECT_NE(hash_combine(hash_combine(0, 1), 2), hash_combine(hash_combine(0, 2), 1));
}

TEST(ValueComparerTest, TypedOperations) {
    CaseInsensitiveComparer c;
    EXPECT_TRUE(c.equals("Abc", "aBC"));
    EXPECT_FALSE(c.equals("abc", "abd"));
    EXPECT_EQ(c.hash("Abc"), c.hash("aBC"));
}

TEST(ValueComparerTest, SnapshotNullable) {
    CaseInsensitiveComparer c;
    EXPECT_FALSE(c.snapshot_nullable(std::nullopt).has_value());
    EXPECT_EQ(c.snapshot_nullable(std::string("x")), std::optional<std::string>("x"));
}

TEST(ValueComparerTest, ReportsValueType) {
    CaseInsensitiveComparer c;
    EXPECT_EQ(c.type(), std::type_index(typeid(std::string)));
}

TEST(ValueComparerTest, BoxedEquals) {
    CaseInsensitiveComparer c;
    auto result = c.equals_boxed(std::any(std::string("HELLO")), std::any(std::string("hello")));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
}

TEST(ValueComparerTest, BoxedHashMatchesTyped) {
    CaseInsensitiveComparer c;
    auto result = c.hash_boxed(std::any(std::string("Key")));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, c.hash("key"));
}

TEST(ValueComparerTest, BoxedNullRejected) {
    CaseInsensitiveComparer c;
    auto eq = c.equals_boxed(std::any{}, std::any(std::string("a")));
    ASSERT_FALSE(eq.has_value());
    EXPECT_EQ(eq.error().code, ErrorCode::InvalidValue);

    auto h = c.hash_boxed(std::any{});
    ASSERT_FALSE(h.has_value());
    EXPECT_EQ(h.error().code, ErrorCode::InvalidValue);
}

TEST(ValueComparerTest, BoxedWrongTypeRejected) {
    CaseInsensitiveComparer c;
    auto eq = c.equals_boxed(std::any(42), std::any(std::string("a")));
    ASSERT_FALSE(eq.has_value());
    EXPECT_EQ(eq.error().code, ErrorCode::InvalidValue);

    auto snap = c.snapshot_boxed(std::any(3.5));
    ASSERT_FALSE(snap.has_value());
    EXPECT_EQ(snap.error().code, ErrorCode::InvalidValue);
}

TEST(ValueComparerTest, BoxedSnapshotKeepsNull) {
    CaseInsensitiveComparer c;
    auto snap = c.snapshot_boxed(std::any{});
    ASSERT_TRUE(snap.has_value());
    EXPECT_FALSE(snap->has_value());
}

TEST(ValueComparerTest, BoxedSnapshotCopies) {
    CaseInsensitiveComparer c;
    auto snap = c.snapshot_boxed(std::any(std::string("abc")));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(std::any_cast<std::string>(*snap), "abc");
}
