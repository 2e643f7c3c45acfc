// SPDX-License-Identifier: MIT

// src/value_comparer.hpp
#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

#include "pg_typemap/error.hpp"

namespace pg_typemap {

/// Fold @p value into @p seed. Order-sensitive.
inline std::size_t hash_combine(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

/// Type-erased value comparer, as seen by a change tracker that holds
/// property values boxed in std::any.
///
/// An empty std::any stands for SQL NULL. Equality and hashing of NULL are
/// decided by the caller, so the boxed equals/hash reject it; snapshot maps
/// NULL to NULL.
class IValueComparer {
public:
    virtual ~IValueComparer() = default;

    /// The value type this comparer operates on.
    virtual std::type_index type() const = 0;

    virtual std::expected<bool, Error> equals_boxed(const std::any& a,
                                                    const std::any& b) const = 0;
    virtual std::expected<std::size_t, Error> hash_boxed(const std::any& value) const = 0;
    virtual std::expected<std::any, Error> snapshot_boxed(const std::any& value) const = 0;
};

/// Value comparer for values of type T: the equals / hash / snapshot triple
/// used by change tracking.
///
/// Implementations must keep hash consistent with equals, and snapshot must
/// return a value that later mutation of the source cannot affect.
template <typename T>
class ValueComparer : public IValueComparer {
public:
    using value_type = T;

    virtual bool equals(const T& a, const T& b) const = 0;
    virtual std::size_t hash(const T& value) const = 0;
    virtual T snapshot(const T& source) const = 0;

    /// Snapshot of a possibly-null value; null stays null.
    std::optional<T> snapshot_nullable(const std::optional<T>& source) const {
        if (!source) {
            return std::nullopt;
        }
        return snapshot(*source);
    }

    std::type_index type() const override { return typeid(T); }

    std::expected<bool, Error> equals_boxed(const std::any& a,
                                            const std::any& b) const override {
        auto lhs = unbox(a);
        if (!lhs) return std::unexpected(std::move(lhs.error()));
        auto rhs = unbox(b);
        if (!rhs) return std::unexpected(std::move(rhs.error()));
        return equals(**lhs, **rhs);
    }

    std::expected<std::size_t, Error> hash_boxed(const std::any& value) const override {
        auto v = unbox(value);
        if (!v) return std::unexpected(std::move(v.error()));
        return hash(**v);
    }

    std::expected<std::any, Error> snapshot_boxed(const std::any& value) const override {
        if (!value.has_value()) {
            return std::any{};
        }
        auto v = unbox(value);
        if (!v) return std::unexpected(std::move(v.error()));
        return std::any(snapshot(**v));
    }

private:
    static std::expected<const T*, Error> unbox(const std::any& value) {
        if (!value.has_value()) {
            return std::unexpected(Error{
                ErrorCode::InvalidValue,
                "null values must be handled by the caller"});
        }
        const T* typed = std::any_cast<T>(&value);
        if (typed == nullptr) {
            return std::unexpected(Error{
                ErrorCode::InvalidValue,
                fmt::format("comparer for {} received a value of type {}",
                            typeid(T).name(), value.type().name())});
        }
        return typed;
    }
};

}  // namespace pg_typemap
