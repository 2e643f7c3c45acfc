// SPDX-License-Identifier: MIT

// src/sequence.hpp
#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

#include "pg_typemap/dense_array.hpp"

namespace pg_typemap {

// sequence_traits - compile-time description of a homogeneous sequence type
// that can back an array column.
//
//   element_type          Type of one array cell.
//   rank                  Number of dimensions.
//   length(s)             Total element count.
//   at(s, i)              Element i in storage order.
//   build_like(s, f)      New sequence of the same shape holding f(s[i]).
template <typename Seq>
struct sequence_traits;

template <typename E, typename Alloc>
struct sequence_traits<std::vector<E, Alloc>> {
    using sequence_type = std::vector<E, Alloc>;
    using element_type = E;
    static constexpr std::size_t rank = 1;

    static std::size_t length(const sequence_type& s) { return s.size(); }
    // decltype(auto): std::vector<bool> yields its elements by value.
    static decltype(auto) at(const sequence_type& s, std::size_t i) { return s[i]; }

    template <typename F>
    static sequence_type build_like(const sequence_type& source, F&& f) {
        sequence_type out(source.get_allocator());
        out.reserve(source.size());
        for (const auto& e : source) {
            out.push_back(f(e));
        }
        return out;
    }
};

template <typename E, std::size_t N>
struct sequence_traits<std::array<E, N>> {
    using sequence_type = std::array<E, N>;
    using element_type = E;
    static constexpr std::size_t rank = 1;

    static std::size_t length(const sequence_type&) { return N; }
    static const element_type& at(const sequence_type& s, std::size_t i) { return s[i]; }

    template <typename F>
    static sequence_type build_like(const sequence_type& source, F&& f) {
        return build_impl(source, f, std::make_index_sequence<N>{});
    }

private:
    template <typename F, std::size_t... Is>
    static sequence_type build_impl(const sequence_type& source, F& f,
                                    std::index_sequence<Is...>) {
        return sequence_type{f(source[Is])...};
    }
};

template <typename E, std::size_t Rank>
struct sequence_traits<DenseArray<E, Rank>> {
    using sequence_type = DenseArray<E, Rank>;
    using element_type = E;
    static constexpr std::size_t rank = Rank;

    static std::size_t length(const sequence_type& s) { return s.size(); }
    static const element_type& at(const sequence_type& s, std::size_t i) { return s.flat(i); }

    template <typename F>
    static sequence_type build_like(const sequence_type& source, F&& f) {
        std::vector<E> data;
        data.reserve(source.size());
        for (const auto& e : source.elements()) {
            data.push_back(f(e));
        }
        return sequence_type(source.extents(), std::move(data));
    }
};

/// A type usable as the host representation of an array column.
template <typename Seq>
concept Sequence = requires {
    typename sequence_traits<Seq>::element_type;
    { sequence_traits<Seq>::rank } -> std::convertible_to<std::size_t>;
};

template <Sequence Seq>
using sequence_element_t = typename sequence_traits<Seq>::element_type;

template <Sequence Seq>
inline constexpr std::size_t sequence_rank_v = sequence_traits<Seq>::rank;

}  // namespace pg_typemap
