// SPDX-License-Identifier: MIT

// src/pg/numeric.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pg_typemap/value_comparer.hpp"

namespace pg_typemap::pg {

/// Fixed-point decimal matching PostgreSQL numeric: unscaled * 10^-scale.
///
/// A negative scale multiplies by a power of ten ({1, -2} is 100), as
/// numeric(p, s) allows for s < 0.
///
/// Equality through operator== is representational, so 1.00 and 1.0 differ.
/// NumericComparer compares numerically.
struct Numeric {
    int64_t unscaled = 0;
    int32_t scale = 0;   ///< Digits after the decimal point

    /// Parse "[+-]digits[.digits]". Returns nullopt on malformed input or
    /// if the digits do not fit in 64 bits.
    static std::optional<Numeric> parse(std::string_view text);

    /// Plain decimal notation, keeping trailing zeros ("1.50", {1, -2} -> "100").
    std::string to_string() const;

    /// Canonical form of the same value: no trailing zeros in unscaled, so
    /// the scale may go negative ({100, 0} -> {1, -2}). Zero is {0, 0}.
    Numeric normalized() const;

    bool operator==(const Numeric&) const = default;
};

/// Trailing-zero-insensitive comparer for Numeric.
class NumericComparer final : public ValueComparer<Numeric> {
public:
    bool equals(const Numeric& a, const Numeric& b) const override;
    std::size_t hash(const Numeric& value) const override;
    Numeric snapshot(const Numeric& source) const override { return source; }

    /// Shared instance used by the numeric mapping and its clones.
    static const std::shared_ptr<const NumericComparer>& instance();
};

}  // namespace pg_typemap::pg
