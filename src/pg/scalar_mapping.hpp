// SPDX-License-Identifier: MIT

// src/pg/scalar_mapping.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <utility>

#include "pg_typemap/pg/pg_types.hpp"
#include "pg_typemap/type_mapping.hpp"

namespace pg_typemap::pg {

/// Element mapping for a built-in PostgreSQL scalar type.
///
/// @tparam PgType  One of the pg_types.hpp descriptors (Integer, Text, ...).
///                 Supplies cpp_type, pg_type_name(), literal() and
///                 default_comparer().
template <typename PgType>
class ScalarTypeMapping final : public TypedTypeMapping<typename PgType::cpp_type> {
public:
    using cpp_type = typename PgType::cpp_type;

    explicit ScalarTypeMapping(Facets facets = {})
        : TypedTypeMapping<cpp_type>(PgType::pg_type_name(), PgType::default_comparer(),
                                     std::move(facets)) {}

    std::expected<std::string, Error> generate_sql_literal(const cpp_type& value) const override {
        return PgType::literal(value);
    }

    std::shared_ptr<const TypeMapping> with_facets(const Facets& facets) const override {
        return std::make_shared<ScalarTypeMapping>(facets);
    }
};

using SmallIntMapping = ScalarTypeMapping<SmallInt>;
using IntegerMapping = ScalarTypeMapping<Integer>;
using BigIntMapping = ScalarTypeMapping<BigInt>;
using RealMapping = ScalarTypeMapping<Real>;
using DoublePrecisionMapping = ScalarTypeMapping<DoublePrecision>;
using BooleanMapping = ScalarTypeMapping<Boolean>;
using CharMapping = ScalarTypeMapping<Char>;
using TextMapping = ScalarTypeMapping<Text>;
using NumericMapping = ScalarTypeMapping<NumericType>;

/// Default element mapping for a C++ value type (see PgTypeFor).
template <typename T>
std::shared_ptr<const TypedTypeMapping<T>> make_default_mapping(Facets facets = {}) {
    return std::make_shared<ScalarTypeMapping<typename PgTypeFor<T>::type>>(
        std::move(facets));
}

}  // namespace pg_typemap::pg
