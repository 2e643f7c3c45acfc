// SPDX-License-Identifier: MIT

// src/array/array_type_mapping.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

#include "pg_typemap/array/array_comparer.hpp"
#include "pg_typemap/array/comparer_selector.hpp"
#include "pg_typemap/error.hpp"
#include "pg_typemap/facets.hpp"
#include "pg_typemap/log.hpp"
#include "pg_typemap/sequence.hpp"
#include "pg_typemap/type_mapping.hpp"

namespace pg_typemap {

/// Maps a PostgreSQL array column (e.g. integer[]) to a C++ sequence.
///
/// Composed from the mapping of its element type: the store type is the
/// element store type plus "[]", literals are built from element literals,
/// and the comparer is chosen from the element mapping's capabilities by
/// select_array_comparer() exactly once, at construction. Clones made by
/// with_facets() share the element mapping and the comparer.
///
/// Only single-dimensional sequences are fully supported. A mapping for a
/// higher-rank sequence can be created, but has no comparer and cannot
/// render literals.
///
/// **Thread safety:** Immutable after construction; safe to share.
///
/// @tparam Seq  std::vector<E>, std::array<E, N> or DenseArray<E, Rank>, where
///              E is the element value type or a nullable wrapper of it
///              (std::optional, std::shared_ptr, raw pointer).
template <Sequence Seq>
class ArrayTypeMapping final : public TypedTypeMapping<Seq> {
public:
    using element_type = sequence_element_t<Seq>;
    using element_value_type = element_value_t<element_type>;
    using ElementMapping = TypedTypeMapping<element_value_type>;
    using Comparer = ArrayComparer<Seq>;

    static constexpr std::size_t kRank = sequence_rank_v<Seq>;

    /// Build the array mapping over @p element.
    ///
    /// @param element     Mapping of the element value type. Must not be null,
    ///                    must map element_value_type and must not itself be an
    ///                    array mapping.
    /// @param store_type  Store type override; defaults to element store type + "[]".
    /// @param facets      Column facets.
    /// @return The mapping, or UnsupportedShape if the element mapping or
    ///         its comparer does not fit the sequence type.
    static std::expected<std::shared_ptr<const ArrayTypeMapping>, Error> create(
            std::shared_ptr<const TypeMapping> element,
            std::optional<std::string> store_type = std::nullopt,
            Facets facets = {}) {
        if (!element) {
            return std::unexpected(Error{
                ErrorCode::UnsupportedShape, "array mapping requires an element mapping"});
        }

        auto typed = std::dynamic_pointer_cast<const ElementMapping>(element);
        if (!typed) {
            return std::unexpected(Error{
                ErrorCode::UnsupportedShape,
                fmt::format("element mapping '{}' maps {}, but the sequence holds {}",
                            element->store_type(), element->clr_type().name(),
                            typeid(element_value_type).name())});
        }
        if (typed->store_type().ends_with("[]")) {
            return std::unexpected(Error{
                ErrorCode::UnsupportedShape,
                fmt::format("element mapping '{}' is an array; nested arrays are not supported",
                            typed->store_type())});
        }

        std::string resolved = store_type ? std::move(*store_type) : typed->store_type() + "[]";
        auto comparer = select_array_comparer<Seq>(*typed);
        if (!comparer) {
            return std::unexpected(std::move(comparer.error()));
        }
        logger().debug("created array mapping '{}' (rank {})", resolved, kRank);

        return std::shared_ptr<const ArrayTypeMapping>(new ArrayTypeMapping(
            std::move(resolved), std::move(typed), std::move(*comparer), std::move(facets)));
    }

    const ElementMapping& element_mapping() const { return *element_; }
    const std::shared_ptr<const ElementMapping>& element_mapping_ptr() const { return element_; }

    /// Bound comparer; null when kRank != 1.
    const std::shared_ptr<const Comparer>& array_comparer() const { return array_comparer_; }
    bool has_comparer() const { return array_comparer_ != nullptr; }

    /// ARRAY[e0,e1,...]::element_type[], NULL for null elements.
    std::expected<std::string, Error> generate_sql_literal(const Seq& value) const override {
        if constexpr (kRank != 1) {
            return std::unexpected(Error{
                ErrorCode::UnsupportedRank, "array literals for rank > 1 are not supported"});
        } else {
            using Traits = sequence_traits<Seq>;
            std::string out = "ARRAY[";
            const std::size_t n = Traits::length(value);
            for (std::size_t i = 0; i < n; ++i) {
                if (i > 0) {
                    out += ',';
                }
                const auto& e = Traits::at(value, i);
                if (detail::is_null_element(e)) {
                    out += "NULL";
                    continue;
                }
                auto literal = element_->generate_sql_literal(detail::non_null_value(e));
                if (!literal) {
                    return std::unexpected(std::move(literal.error()));
                }
                out += *literal;
            }
            fmt::format_to(std::back_inserter(out), "]::{}[]", element_->store_type());
            return out;
        }
    }

    std::shared_ptr<const TypeMapping> with_facets(const Facets& facets) const override {
        return with_facets_typed(facets);
    }

    std::shared_ptr<const ArrayTypeMapping> with_facets_typed(const Facets& facets) const {
        return std::shared_ptr<const ArrayTypeMapping>(
            new ArrayTypeMapping(this->store_type(), element_, array_comparer_, facets));
    }

    // Comparison through the bound comparer. Fail with ComparerUnavailable
    // instead of guessing when no comparer was bound.

    std::expected<bool, Error> equals(const Seq& a, const Seq& b) const {
        if (!array_comparer_) return std::unexpected(comparer_unavailable());
        return array_comparer_->equals(a, b);
    }

    std::expected<std::size_t, Error> hash(const Seq& value) const {
        if (!array_comparer_) return std::unexpected(comparer_unavailable());
        return array_comparer_->hash(value);
    }

    std::expected<Seq, Error> snapshot(const Seq& source) const {
        if (!array_comparer_) return std::unexpected(comparer_unavailable());
        return array_comparer_->snapshot(source);
    }

    std::expected<std::optional<Seq>, Error> snapshot(const std::optional<Seq>& source) const {
        if (!array_comparer_) return std::unexpected(comparer_unavailable());
        return array_comparer_->snapshot_nullable(source);
    }

private:
    ArrayTypeMapping(std::string store_type,
                     std::shared_ptr<const ElementMapping> element,
                     std::shared_ptr<const Comparer> comparer,
                     Facets facets)
        : TypedTypeMapping<Seq>(std::move(store_type), comparer, std::move(facets))
        , element_(std::move(element))
        , array_comparer_(std::move(comparer)) {}

    Error comparer_unavailable() const {
        return Error{ErrorCode::ComparerUnavailable,
                     fmt::format("'{}' has no comparer: rank {} arrays are not supported",
                                 this->store_type(), kRank)};
    }

    std::shared_ptr<const ElementMapping> element_;
    std::shared_ptr<const Comparer> array_comparer_;
};

/// Shorthand for ArrayTypeMapping<Seq>::create().
template <Sequence Seq>
std::expected<std::shared_ptr<const ArrayTypeMapping<Seq>>, Error> make_array_mapping(
        std::shared_ptr<const TypeMapping> element,
        std::optional<std::string> store_type = std::nullopt,
        Facets facets = {}) {
    return ArrayTypeMapping<Seq>::create(std::move(element), std::move(store_type),
                                         std::move(facets));
}

}  // namespace pg_typemap
