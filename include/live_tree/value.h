// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable JSON-like Value used for frozen (raw) data and snapshots.
///
/// A Value can represent:
/// - Null (std::monostate)
/// - Primitive types: bool, int64, double, string
/// - Binary blobs (boxed byte buffers)
/// - Containers: map and vector (immer's persistent containers)
///
/// Values are deep-frozen by construction: every "modification" returns a
/// new Value and leaves the original untouched. This is what mark_raw()
/// produces, what the store keeps for non-container content, and what
/// to_json() returns for a view.

#pragma once

#include <live_tree/live_tree_config.h>
#include <live_tree/api.h>
#include <live_tree/log.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <compare>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace live_tree {

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

/// @brief Byte buffer type for binary blobs
using ByteBuffer = std::vector<uint8_t>;

template <typename MemoryPolicy>
using BoxedBytes = immer::box<ByteBuffer, MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using boxed_bytes   = BoxedBytes<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 boxed_bytes,
                 value_map,
                 value_vector>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    BasicValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(ByteBuffer v) : data(boxed_bytes{std::move(v)}) {}
    BasicValue(boxed_bytes v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_bytes() const noexcept { return is<boxed_bytes>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_map() || is_vector(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] ByteBuffer as_bytes() const {
        if (auto* p = get_if<boxed_bytes>()) return p->get();
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot push on non-vector type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }
};

// ============================================================
// Memory Policy
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

using Value       = BasicValue<unsafe_memory_policy>;
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

// Convert Value to a short human-readable string ("{map:3}", "[vector:2]", ...)
[[nodiscard]] LIVE_TREE_API std::string value_to_string(const Value& val);

// Serialize to JSON text. Byte blobs are written as arrays of numbers.
[[nodiscard]] LIVE_TREE_API std::string to_json(const Value& val, bool compact = true);

LIVE_TREE_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;

} // namespace live_tree
