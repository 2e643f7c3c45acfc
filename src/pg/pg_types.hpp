// SPDX-License-Identifier: MIT

// src/pg/pg_types.hpp
#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "pg_typemap/pg/numeric.hpp"
#include "pg_typemap/value_comparer.hpp"

namespace pg_typemap::pg {

namespace detail {

// Quote a string as a PostgreSQL string literal, doubling embedded quotes.
// Assumes standard_conforming_strings (backslashes are literal).
std::string quote_literal(std::string_view s);

// Shortest round-trip form for finite values; 'NaN'/'Infinity'/'-Infinity'
// cast to the column type otherwise.
std::string float_literal(double value, std::string_view type_name);

}  // namespace detail

/// Comparer for floating-point elements: NaN equals NaN, and -0.0 equals 0.0.
/// Keeps array equality reflexive for arrays containing NaN.
template <typename T>
class FloatingPointComparer final : public ValueComparer<T> {
public:
    bool equals(const T& a, const T& b) const override {
        if (std::isnan(a)) return std::isnan(b);
        return a == b;
    }

    std::size_t hash(const T& value) const override {
        if (std::isnan(value)) return 0x7ff8;
        if (value == T{0}) return 0;
        return std::hash<T>{}(value);
    }

    T snapshot(const T& source) const override { return source; }

    static const std::shared_ptr<const FloatingPointComparer>& instance() {
        static const std::shared_ptr<const FloatingPointComparer> comparer =
            std::make_shared<FloatingPointComparer>();
        return comparer;
    }
};

// PostgreSQL smallint
struct SmallInt {
    using cpp_type = int16_t;
    static constexpr const char* pg_type_name() { return "smallint"; }
    static std::string literal(int16_t val) { return fmt::format("{}", val); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL integer
struct Integer {
    using cpp_type = int32_t;
    static constexpr const char* pg_type_name() { return "integer"; }
    static std::string literal(int32_t val) { return fmt::format("{}", val); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL bigint
struct BigInt {
    using cpp_type = int64_t;
    static constexpr const char* pg_type_name() { return "bigint"; }
    static std::string literal(int64_t val) { return fmt::format("{}", val); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL real (4 bytes)
struct Real {
    using cpp_type = float;
    static constexpr const char* pg_type_name() { return "real"; }
    static std::string literal(float val) {
        if (std::isfinite(val)) return fmt::format("{}", val);
        return detail::float_literal(val, pg_type_name());
    }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() {
        return FloatingPointComparer<float>::instance();
    }
};

// PostgreSQL double precision (8 bytes)
struct DoublePrecision {
    using cpp_type = double;
    static constexpr const char* pg_type_name() { return "double precision"; }
    static std::string literal(double val) { return detail::float_literal(val, pg_type_name()); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() {
        return FloatingPointComparer<double>::instance();
    }
};

// PostgreSQL boolean
struct Boolean {
    using cpp_type = bool;
    static constexpr const char* pg_type_name() { return "boolean"; }
    static std::string literal(bool val) { return val ? "TRUE" : "FALSE"; }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL char(1)
struct Char {
    using cpp_type = char;
    static constexpr const char* pg_type_name() { return "char(1)"; }
    static std::string literal(char val) { return detail::quote_literal(std::string_view(&val, 1)); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL text (variable length)
struct Text {
    using cpp_type = std::string;
    static constexpr const char* pg_type_name() { return "text"; }
    static std::string literal(const std::string& val) { return detail::quote_literal(val); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() { return nullptr; }
};

// PostgreSQL numeric (arbitrary precision, compared trailing-zero-insensitively)
struct NumericType {
    using cpp_type = Numeric;
    static constexpr const char* pg_type_name() { return "numeric"; }
    static std::string literal(const Numeric& val) { return val.to_string(); }
    static std::shared_ptr<const ValueComparer<cpp_type>> default_comparer() {
        return NumericComparer::instance();
    }
};

// Map C++ value types to their default PostgreSQL type.
template <typename T>
struct PgTypeFor;

template <> struct PgTypeFor<int16_t>     { using type = SmallInt; };
template <> struct PgTypeFor<int32_t>     { using type = Integer; };
template <> struct PgTypeFor<int64_t>     { using type = BigInt; };
template <> struct PgTypeFor<float>       { using type = Real; };
template <> struct PgTypeFor<double>      { using type = DoublePrecision; };
template <> struct PgTypeFor<bool>        { using type = Boolean; };
template <> struct PgTypeFor<char>        { using type = Char; };
template <> struct PgTypeFor<std::string> { using type = Text; };
template <> struct PgTypeFor<Numeric>     { using type = NumericType; };

}  // namespace pg_typemap::pg
