// SPDX-License-Identifier: MIT

// src/custom_mapping.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "pg_typemap/type_mapping.hpp"

namespace pg_typemap {

/// Element mapping assembled from a store type name, a literal renderer and
/// an optional comparer. Used for application types (enums, composites,
/// domain types) that have no built-in ScalarTypeMapping.
template <typename T>
class CustomTypeMapping final : public TypedTypeMapping<T> {
public:
    using LiteralRenderer = std::function<std::string(const T&)>;

    CustomTypeMapping(std::string store_type,
                      LiteralRenderer renderer,
                      std::shared_ptr<const ValueComparer<T>> comparer = nullptr,
                      Facets facets = {})
        : TypedTypeMapping<T>(std::move(store_type), std::move(comparer), std::move(facets))
        , renderer_(std::move(renderer)) {}

    std::expected<std::string, Error> generate_sql_literal(const T& value) const override {
        return renderer_(value);
    }

    std::shared_ptr<const TypeMapping> with_facets(const Facets& facets) const override {
        return std::make_shared<CustomTypeMapping>(
            this->store_type(), renderer_, this->comparer(), facets);
    }

private:
    LiteralRenderer renderer_;
};

}  // namespace pg_typemap
