// SPDX-License-Identifier: MIT

// src/array/array_comparer.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <cstring>
#include <functional>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

#include "pg_typemap/nullable.hpp"
#include "pg_typemap/sequence.hpp"
#include "pg_typemap/value_comparer.hpp"

namespace pg_typemap {

/// How an array comparer compares its elements. Chosen once per mapping.
enum class ComparerStrategy {
    Delegating,      // Element mapping supplies a comparer
    SelfEquatable,   // Element value type has its own operator==
    FallbackEquals,  // Identity or object-representation equality
};

constexpr std::string_view comparer_strategy_name(ComparerStrategy strategy) {
    switch (strategy) {
        case ComparerStrategy::Delegating: return "delegating";
        case ComparerStrategy::SelfEquatable: return "self_equatable";
        case ComparerStrategy::FallbackEquals: return "fallback_equals";
    }
    return "";
}

/// Element types whose non-null values compare with their own operator==.
template <typename E>
concept TypedEquatable = std::equality_comparable<element_value_t<E>>;

/// Element types with a universal equality: handles compare by identity,
/// everything else by object representation.
template <typename E>
concept UniversallyEquatable =
    nullable_traits<E>::is_handle ||
    std::has_unique_object_representations_v<element_value_t<E>>;

namespace detail {

inline constexpr std::size_t kNullElementHash = 0x2545f491;

template <typename T>
std::size_t value_hash(const T& value) {
    if constexpr (requires { { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>; }) {
        return std::hash<T>{}(value);
    } else {
        // No std::hash: every value hashes alike, which is still consistent
        // with equals.
        return 0;
    }
}

// Length check first, then pairwise in index order, stopping at the first
// mismatch.
template <typename Seq, typename ElementEquals>
bool sequence_equals(const Seq& a, const Seq& b, ElementEquals&& element_equals) {
    using Traits = sequence_traits<Seq>;
    const std::size_t n = Traits::length(a);
    if (n != Traits::length(b)) {
        return false;
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!element_equals(Traits::at(a, i), Traits::at(b, i))) {
            return false;
        }
    }
    return true;
}

template <typename Seq, typename ElementHash>
std::size_t sequence_hash(const Seq& s, ElementHash&& element_hash) {
    using Traits = sequence_traits<Seq>;
    const std::size_t n = Traits::length(s);
    std::size_t seed = std::hash<std::size_t>{}(n);
    for (std::size_t i = 0; i < n; ++i) {
        seed = hash_combine(seed, element_hash(Traits::at(s, i)));
    }
    return seed;
}

// Null rule shared by all strategies: both null are equal, one null is not.
// Returns true when the pair was decided and stores the verdict in @p equal.
template <typename E>
bool decide_nulls(const E& x, const E& y, bool& equal) {
    if constexpr (nullable_traits<E>::is_nullable) {
        using Nullable = nullable_traits<E>;
        const bool x_null = Nullable::is_null(x);
        const bool y_null = Nullable::is_null(y);
        if (x_null || y_null) {
            equal = x_null && y_null;
            return true;
        }
    }
    return false;
}

template <typename E>
const element_value_t<E>& non_null_value(const E& e) {
    if constexpr (nullable_traits<E>::is_nullable) {
        return nullable_traits<E>::value(e);
    } else {
        return e;
    }
}

template <typename E>
bool is_null_element(const E& e) {
    if constexpr (nullable_traits<E>::is_nullable) {
        return nullable_traits<E>::is_null(e);
    } else {
        return false;
    }
}

template <typename E>
bool universal_equals(const E& x, const E& y) {
    if constexpr (nullable_traits<E>::is_handle) {
        return nullable_traits<E>::identity(x) == nullable_traits<E>::identity(y);
    } else {
        using V = element_value_t<E>;
        return std::memcmp(&non_null_value(x), &non_null_value(y), sizeof(V)) == 0;
    }
}

template <typename E>
std::size_t universal_hash(const E& e) {
    if constexpr (nullable_traits<E>::is_handle) {
        return std::hash<const void*>{}(nullable_traits<E>::identity(e));
    } else {
        using V = element_value_t<E>;
        const auto* bytes = reinterpret_cast<const char*>(&non_null_value(e));
        return std::hash<std::string_view>{}(std::string_view(bytes, sizeof(V)));
    }
}

}  // namespace detail

/// Value comparer for a single-dimensional sequence.
///
/// equals() short-circuits on length, then compares pairwise in index order.
/// hash() folds the element hashes in order, so equal sequences hash equally.
/// snapshot() builds a new sequence of the same length; the caller's
/// sequence is never modified.
///
/// Only rank-1 sequences get an ArrayComparer; see select_array_comparer().
template <typename Seq>
class ArrayComparer : public ValueComparer<Seq> {
public:
    using element_type = sequence_element_t<Seq>;
    using element_value_type = element_value_t<element_type>;

    virtual ComparerStrategy strategy() const = 0;
};

/// Forwards per-element equals/hash/snapshot to the element mapping's comparer.
///
/// The element comparer is typed over the non-null value type, so for
/// nullable elements the null rule is applied here before forwarding.
/// Raw pointer elements are copied as-is by snapshot().
template <typename Seq>
class DelegatingArrayComparer final : public ArrayComparer<Seq> {
public:
    using typename ArrayComparer<Seq>::element_type;
    using typename ArrayComparer<Seq>::element_value_type;
    using ElementComparer = ValueComparer<element_value_type>;

    explicit DelegatingArrayComparer(std::shared_ptr<const ElementComparer> element_comparer)
        : element_comparer_(std::move(element_comparer)) {}

    ComparerStrategy strategy() const override { return ComparerStrategy::Delegating; }

    const std::shared_ptr<const ElementComparer>& element_comparer() const {
        return element_comparer_;
    }

    bool equals(const Seq& a, const Seq& b) const override {
        return detail::sequence_equals(a, b, [this](const element_type& x, const element_type& y) {
            bool equal = false;
            if (detail::decide_nulls(x, y, equal)) {
                return equal;
            }
            return element_comparer_->equals(detail::non_null_value(x),
                                             detail::non_null_value(y));
        });
    }

    std::size_t hash(const Seq& value) const override {
        return detail::sequence_hash(value, [this](const element_type& e) {
            if (detail::is_null_element(e)) {
                return detail::kNullElementHash;
            }
            return element_comparer_->hash(detail::non_null_value(e));
        });
    }

    Seq snapshot(const Seq& source) const override {
        return sequence_traits<Seq>::build_like(source, [this](const element_type& e) -> element_type {
            if constexpr (std::is_pointer_v<element_type>) {
                // Non-owning: the snapshot refers to the same pointee.
                return e;
            } else if constexpr (nullable_traits<element_type>::is_nullable) {
                if (nullable_traits<element_type>::is_null(e)) {
                    return e;
                }
                return nullable_traits<element_type>::wrap(
                    element_comparer_->snapshot(nullable_traits<element_type>::value(e)));
            } else {
                return element_comparer_->snapshot(e);
            }
        });
    }

private:
    std::shared_ptr<const ElementComparer> element_comparer_;
};

/// Compares elements with their own operator==. Snapshot copies elements.
template <typename Seq>
    requires TypedEquatable<sequence_element_t<Seq>>
class EquatableArrayComparer final : public ArrayComparer<Seq> {
public:
    using typename ArrayComparer<Seq>::element_type;

    ComparerStrategy strategy() const override { return ComparerStrategy::SelfEquatable; }

    bool equals(const Seq& a, const Seq& b) const override {
        return detail::sequence_equals(a, b, [](const element_type& x, const element_type& y) {
            bool equal = false;
            if (detail::decide_nulls(x, y, equal)) {
                return equal;
            }
            return detail::non_null_value(x) == detail::non_null_value(y);
        });
    }

    std::size_t hash(const Seq& value) const override {
        return detail::sequence_hash(value, [](const element_type& e) {
            if (detail::is_null_element(e)) {
                return detail::kNullElementHash;
            }
            return detail::value_hash(detail::non_null_value(e));
        });
    }

    Seq snapshot(const Seq& source) const override {
        return sequence_traits<Seq>::build_like(
            source, [](const element_type& e) -> element_type { return e; });
    }
};

/// Last resort when the element has neither a comparer nor operator==:
/// handles compare by identity, other values by object representation.
template <typename Seq>
    requires UniversallyEquatable<sequence_element_t<Seq>>
class FallbackArrayComparer final : public ArrayComparer<Seq> {
public:
    using typename ArrayComparer<Seq>::element_type;

    ComparerStrategy strategy() const override { return ComparerStrategy::FallbackEquals; }

    bool equals(const Seq& a, const Seq& b) const override {
        return detail::sequence_equals(a, b, [](const element_type& x, const element_type& y) {
            bool equal = false;
            if (detail::decide_nulls(x, y, equal)) {
                return equal;
            }
            return detail::universal_equals(x, y);
        });
    }

    std::size_t hash(const Seq& value) const override {
        return detail::sequence_hash(value, [](const element_type& e) {
            if (detail::is_null_element(e)) {
                return detail::kNullElementHash;
            }
            return detail::universal_hash(e);
        });
    }

    Seq snapshot(const Seq& source) const override {
        return sequence_traits<Seq>::build_like(
            source, [](const element_type& e) -> element_type { return e; });
    }
};

}  // namespace pg_typemap
