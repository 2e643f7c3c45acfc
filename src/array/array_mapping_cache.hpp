// SPDX-License-Identifier: MIT

// src/array/array_mapping_cache.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "pg_typemap/array/array_type_mapping.hpp"
#include "pg_typemap/value_comparer.hpp"

namespace pg_typemap {

// ArrayMappingCache - memoizes array mappings by (sequence type, store type).
//
// Construction is pure, so two threads racing on the same key may both build
// a mapping; the first one inserted is kept and returned to both.
//
// Thread safety: all methods are thread-safe.
class ArrayMappingCache {
public:
    template <Sequence Seq>
    std::expected<std::shared_ptr<const ArrayTypeMapping<Seq>>, Error> get_or_create(
            std::shared_ptr<const TypeMapping> element,
            std::optional<std::string> store_type = std::nullopt) {
        if (!element) {
            return std::unexpected(Error{
                ErrorCode::UnsupportedShape, "array mapping requires an element mapping"});
        }
        Key key{typeid(Seq), store_type ? *store_type : element->store_type() + "[]"};

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = mappings_.find(key);
            if (it != mappings_.end()) {
                return std::static_pointer_cast<const ArrayTypeMapping<Seq>>(it->second);
            }
        }

        // Build outside the lock.
        auto created = ArrayTypeMapping<Seq>::create(std::move(element), std::move(store_type));
        if (!created) {
            return std::unexpected(std::move(created.error()));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mappings_.try_emplace(std::move(key), *created).first;
        return std::static_pointer_cast<const ArrayTypeMapping<Seq>>(it->second);
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mappings_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        mappings_.clear();
    }

private:
    struct Key {
        std::type_index sequence_type;
        std::string store_type;

        bool operator==(const Key&) const = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const {
            return hash_combine(std::hash<std::type_index>{}(key.sequence_type),
                                std::hash<std::string>{}(key.store_type));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_ptr<const TypeMapping>, KeyHash> mappings_;
};

}  // namespace pg_typemap
