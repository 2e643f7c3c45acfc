// SPDX-License-Identifier: MIT

// src/type_mapping.hpp
#pragma once

#include <any>
#include <expected>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

#include "pg_typemap/error.hpp"
#include "pg_typemap/facets.hpp"
#include "pg_typemap/value_comparer.hpp"

namespace pg_typemap {

/// Type-erased mapping between a PostgreSQL store type and a C++ value type.
///
/// Mappings are immutable once constructed and are shared through
/// std::shared_ptr<const TypeMapping>. Variants with different facets are
/// produced by with_facets(), never by mutation.
class TypeMapping {
public:
    virtual ~TypeMapping() = default;

    /// PostgreSQL type name (e.g. "integer", "text[]").
    const std::string& store_type() const { return store_type_; }

    /// C++ value type of non-null values.
    std::type_index clr_type() const { return clr_type_; }

    const Facets& facets() const { return facets_; }

    /// Nullable unless the facets say otherwise.
    bool is_nullable() const { return facets_.nullable.value_or(true); }

    /// Comparer supplied by this mapping, or null if it relies on the
    /// value type's own semantics.
    virtual std::shared_ptr<const IValueComparer> comparer_base() const = 0;

    /// Render a boxed value as an SQL literal. An empty std::any renders NULL.
    std::expected<std::string, Error> generate_sql_literal_boxed(const std::any& value) const;

    /// Copy of this mapping with different facets. Shares the comparer.
    virtual std::shared_ptr<const TypeMapping> with_facets(const Facets& facets) const = 0;

protected:
    TypeMapping(std::string store_type, std::type_index clr_type, Facets facets);

    virtual std::expected<std::string, Error> generate_non_null_sql_literal_boxed(
        const std::any& value) const = 0;

private:
    std::string store_type_;
    std::type_index clr_type_;
    Facets facets_;
};

/// Mapping for non-null values of type T.
///
/// @tparam T  C++ value type (the element type for scalar mappings,
///            the sequence type for array mappings).
template <typename T>
class TypedTypeMapping : public TypeMapping {
public:
    using value_type = T;

    /// Typed comparer, or null.
    const std::shared_ptr<const ValueComparer<T>>& comparer() const { return comparer_; }

    std::shared_ptr<const IValueComparer> comparer_base() const override { return comparer_; }

    /// Render a non-null value as an SQL literal.
    virtual std::expected<std::string, Error> generate_sql_literal(const T& value) const = 0;

protected:
    TypedTypeMapping(std::string store_type,
                     std::shared_ptr<const ValueComparer<T>> comparer,
                     Facets facets)
        : TypeMapping(std::move(store_type), typeid(T), std::move(facets))
        , comparer_(std::move(comparer)) {}

    std::expected<std::string, Error> generate_non_null_sql_literal_boxed(
            const std::any& value) const override {
        const T* typed = std::any_cast<T>(&value);
        if (typed == nullptr) {
            return std::unexpected(Error{
                ErrorCode::InvalidValue,
                fmt::format("mapping for '{}' cannot render a value of type {}",
                            store_type(), value.type().name())});
        }
        return generate_sql_literal(*typed);
    }

private:
    std::shared_ptr<const ValueComparer<T>> comparer_;
};

}  // namespace pg_typemap
