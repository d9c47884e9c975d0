// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-based builders for O(n) construction of Value containers.
///
/// @code
///   Value point = MapBuilder()
///       .set("x", 1)
///       .set("y", 2)
///       .finish();
/// @endcode

#pragma once

#include <live_tree/value.h>

namespace live_tree {

/// Builder for value_map
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value.
    /// The builder is left empty.
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for value_vector
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

LIVE_TREE_EXTERN_TEMPLATE class BasicMapBuilder<unsafe_memory_policy>;
LIVE_TREE_EXTERN_TEMPLATE class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace live_tree
