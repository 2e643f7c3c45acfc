// SPDX-License-Identifier: MIT

// src/dense_array.hpp
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <numeric>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace pg_typemap {

/// Rectangular array of fixed rank, stored row-major.
///
/// The C++ counterpart of a PostgreSQL multi-dimensional array value
/// (e.g. integer[][]). Every row has the same length, so jagged shapes are
/// not representable. Only DenseArray<T, 1> is usable with array comparers;
/// higher ranks map to a comparer-less ArrayTypeMapping.
///
/// @tparam T     Element type.
/// @tparam Rank  Number of dimensions (>= 1).
template <typename T, std::size_t Rank>
class DenseArray {
    static_assert(Rank >= 1, "DenseArray needs at least one dimension");
    static_assert(!std::is_same_v<T, bool>, "DenseArray<bool> is not supported, use char");

public:
    using value_type = T;
    using extents_type = std::array<std::size_t, Rank>;

    DenseArray() { extents_.fill(0); }

    /// Construct with the given extents, every element set to @p fill.
    explicit DenseArray(const extents_type& extents, const T& fill = T{})
        : extents_(extents), data_(element_count(extents), fill) {}

    /// Construct from extents and row-major element data.
    /// @throws std::invalid_argument if the data size does not match the extents.
    DenseArray(const extents_type& extents, std::vector<T> data)
        : extents_(extents), data_(std::move(data)) {
        if (data_.size() != element_count(extents_)) {
            throw std::invalid_argument("DenseArray data size does not match extents");
        }
    }

    static constexpr std::size_t rank() { return Rank; }

    const extents_type& extents() const { return extents_; }
    std::size_t extent(std::size_t dim) const { return extents_[dim]; }

    /// Total number of elements across all dimensions.
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    template <typename... Index>
    T& operator()(Index... index) {
        static_assert(sizeof...(Index) == Rank, "index count must equal rank");
        return data_[offset({static_cast<std::size_t>(index)...})];
    }

    template <typename... Index>
    const T& operator()(Index... index) const {
        static_assert(sizeof...(Index) == Rank, "index count must equal rank");
        return data_[offset({static_cast<std::size_t>(index)...})];
    }

    /// Row-major element access.
    T& flat(std::size_t i) { return data_[i]; }
    const T& flat(std::size_t i) const { return data_[i]; }

    std::span<T> elements() { return data_; }
    std::span<const T> elements() const { return data_; }

    bool operator==(const DenseArray&) const = default;

private:
    static std::size_t element_count(const extents_type& extents) {
        return std::accumulate(extents.begin(), extents.end(), std::size_t{1},
                               std::multiplies<>{});
    }

    std::size_t offset(const extents_type& index) const {
        std::size_t off = 0;
        for (std::size_t d = 0; d < Rank; ++d) {
            if (index[d] >= extents_[d]) {
                throw std::out_of_range("DenseArray index out of range");
            }
            off = off * extents_[d] + index[d];
        }
        return off;
    }

    extents_type extents_;
    std::vector<T> data_;
};

}  // namespace pg_typemap
