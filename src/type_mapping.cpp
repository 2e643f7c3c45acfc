// SPDX-License-Identifier: MIT

#include "pg_typemap/type_mapping.hpp"

namespace pg_typemap {

TypeMapping::TypeMapping(std::string store_type, std::type_index clr_type, Facets facets)
    : store_type_(std::move(store_type))
    , clr_type_(clr_type)
    , facets_(std::move(facets)) {}

std::expected<std::string, Error> TypeMapping::generate_sql_literal_boxed(
        const std::any& value) const {
    if (!value.has_value()) {
        return std::string("NULL");
    }
    return generate_non_null_sql_literal_boxed(value);
}

}  // namespace pg_typemap
