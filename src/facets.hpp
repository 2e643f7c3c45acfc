// SPDX-License-Identifier: MIT

// src/facets.hpp
#pragma once

#include <cstdint>
#include <optional>

namespace pg_typemap {

/// Column facets carried by a type mapping.
///
/// Facets describe the column, not the values in it: they never influence
/// which comparer a mapping uses. Unset fields mean "not specified".
struct Facets {
    std::optional<bool> nullable;      ///< Column accepts NULL
    std::optional<int32_t> size;       ///< Length limit (e.g. varchar(n))
    std::optional<int32_t> precision;  ///< Total digits (numeric)
    std::optional<int32_t> scale;      ///< Fractional digits (numeric)

    /// Preset for an unconstrained, nullable column.
    static Facets Defaults() {
        return Facets{};
    }

    /// Preset for a NOT NULL column.
    static Facets NotNull() {
        return Facets{
            .nullable = false,
        };
    }

    bool operator==(const Facets&) const = default;
};

}  // namespace pg_typemap
