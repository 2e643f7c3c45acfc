// SPDX-License-Identifier: MIT

// src/array/comparer_selector.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

#include "pg_typemap/array/array_comparer.hpp"
#include "pg_typemap/error.hpp"
#include "pg_typemap/log.hpp"
#include "pg_typemap/sequence.hpp"
#include "pg_typemap/type_mapping.hpp"

namespace pg_typemap {

/// Element mapping type accepted for sequences of type Seq.
template <Sequence Seq>
using element_mapping_t = TypedTypeMapping<element_value_t<sequence_element_t<Seq>>>;

namespace detail {

// Typed view of @p element, or UnsupportedShape when it maps another value
// type or supplies a comparer for one.
template <Sequence Seq>
std::expected<const element_mapping_t<Seq>*, Error> typed_element_mapping(
        const TypeMapping& element) {
    using element_value_type = element_value_t<sequence_element_t<Seq>>;

    const auto* typed = dynamic_cast<const element_mapping_t<Seq>*>(&element);
    if (typed == nullptr || element.clr_type() != std::type_index(typeid(element_value_type))) {
        return std::unexpected(Error{
            ErrorCode::UnsupportedShape,
            fmt::format("element mapping '{}' maps {}, but the sequence holds {}",
                        element.store_type(), element.clr_type().name(),
                        typeid(element_value_type).name())});
    }
    if (auto base = element.comparer_base();
        base && base->type() != std::type_index(typeid(element_value_type))) {
        return std::unexpected(Error{
            ErrorCode::UnsupportedShape,
            fmt::format("comparer of element mapping '{}' compares {}, but the sequence holds {}",
                        element.store_type(), base->type().name(),
                        typeid(element_value_type).name())});
    }
    return typed;
}

}  // namespace detail

/// Strategy select_array_comparer() would bind for Seq, or nullopt when it
/// would bind none (rank != 1, or an element mapping that does not fit).
template <Sequence Seq>
std::optional<ComparerStrategy> select_strategy(const TypeMapping& element) {
    using element_type = sequence_element_t<Seq>;

    if constexpr (sequence_rank_v<Seq> != 1) {
        return std::nullopt;
    } else {
        auto typed = detail::typed_element_mapping<Seq>(element);
        if (!typed) {
            return std::nullopt;
        }
        if ((*typed)->comparer()) {
            return ComparerStrategy::Delegating;
        }
        if constexpr (TypedEquatable<element_type>) {
            return ComparerStrategy::SelfEquatable;
        } else {
            return ComparerStrategy::FallbackEquals;
        }
    }
}

/// Select and instantiate the comparer for sequences of type Seq.
///
/// Precedence, first match wins:
///   1. rank != 1                        -> null (no comparer)
///   2. element mapping maps another type,
///      or its comparer does             -> UnsupportedShape
///   3. element mapping has a comparer   -> DelegatingArrayComparer
///   4. element value has operator==     -> EquatableArrayComparer
///   5. otherwise                        -> FallbackArrayComparer
///
/// Runs once per mapping; the returned comparer does no type inspection
/// afterwards. Element types that fail 4 and have no universal equality
/// are rejected at compile time.
template <Sequence Seq>
std::expected<std::shared_ptr<const ArrayComparer<Seq>>, Error> select_array_comparer(
        const TypeMapping& element) {
    using element_type = sequence_element_t<Seq>;
    using Result = std::shared_ptr<const ArrayComparer<Seq>>;

    if constexpr (sequence_rank_v<Seq> != 1) {
        logger().warn("no comparer for {}[] with rank {}: only single-dimensional arrays "
                      "support change tracking",
                      element.store_type(), sequence_rank_v<Seq>);
        return Result{};
    } else {
        auto typed = detail::typed_element_mapping<Seq>(element);
        if (!typed) {
            return std::unexpected(std::move(typed.error()));
        }
        if (const auto& element_comparer = (*typed)->comparer()) {
            logger().debug("{}[]: delegating to element comparer", element.store_type());
            return Result(std::make_shared<DelegatingArrayComparer<Seq>>(element_comparer));
        }
        if constexpr (TypedEquatable<element_type>) {
            logger().debug("{}[]: comparing elements with operator==", element.store_type());
            return Result(std::make_shared<EquatableArrayComparer<Seq>>());
        } else {
            static_assert(UniversallyEquatable<element_type>,
                          "element type needs a comparer, operator==, or a unique object "
                          "representation");
            logger().debug("{}[]: comparing elements with universal equality", element.store_type());
            return Result(std::make_shared<FallbackArrayComparer<Seq>>());
        }
    }
}

}  // namespace pg_typemap
