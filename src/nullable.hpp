// SPDX-License-Identifier: MIT

// src/nullable.hpp
#pragma once

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace pg_typemap {

// nullable_traits - describes how an array element represents SQL NULL.
//
// Plain value types are never null. std::optional<T>, std::shared_ptr<T> and
// T* are nullable; the pointer types are also handles, so their "universal"
// equality is identity of the pointee rather than its contents.
template <typename E>
struct nullable_traits {
    static constexpr bool is_nullable = false;
    static constexpr bool is_handle = false;
    using value_type = E;
};

template <typename T>
struct nullable_traits<std::optional<T>> {
    static constexpr bool is_nullable = true;
    static constexpr bool is_handle = false;
    using value_type = T;

    static bool is_null(const std::optional<T>& v) { return !v.has_value(); }
    static const T& value(const std::optional<T>& v) { return *v; }
    static std::optional<T> wrap(T v) { return std::optional<T>(std::move(v)); }
};

template <typename T>
struct nullable_traits<std::shared_ptr<T>> {
    static constexpr bool is_nullable = true;
    static constexpr bool is_handle = true;
    using value_type = std::remove_const_t<T>;

    static bool is_null(const std::shared_ptr<T>& v) { return v == nullptr; }
    static const value_type& value(const std::shared_ptr<T>& v) { return *v; }
    static const void* identity(const std::shared_ptr<T>& v) { return v.get(); }
    // Snapshots of handles own a fresh pointee.
    static std::shared_ptr<T> wrap(value_type v) { return std::make_shared<T>(std::move(v)); }
};

// Raw pointers are non-owning handles. There is no wrap(): a snapshot cannot
// allocate a pointee it would not own, so pointer elements snapshot as the
// same pointer.
template <typename T>
struct nullable_traits<T*> {
    static constexpr bool is_nullable = true;
    static constexpr bool is_handle = true;
    using value_type = std::remove_const_t<T>;

    static bool is_null(T* v) { return v == nullptr; }
    static const value_type& value(T* v) { return *v; }
    static const void* identity(T* v) { return v; }
};

template <typename E>
inline constexpr bool is_nullable_v = nullable_traits<E>::is_nullable;

/// Non-null value type of an element (T for std::optional<T>, E otherwise).
template <typename E>
using element_value_t = typename nullable_traits<E>::value_type;

}  // namespace pg_typemap
