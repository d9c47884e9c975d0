// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file data.h
/// @brief Data - the dynamic value read from and written to views.
///
/// Data can hold:
/// - Primitives: null, bool, int64, double, string, binary blob
/// - Plain containers: JsonMap / JsonArray, shared by reference. Two Data
///   holding the same JsonMapPtr are the *same* object, which is how the
///   layer detects aliasing and cycles.
/// - Raw data: an immutable Value (see mark_raw()), never converted
/// - Views: MapView / ArrayView
/// - Store nodes: SharedMapPtr / SharedArrayPtr
/// - Foreign: any other host object; rejected by conversion
///
/// Equality is by value for primitives and raw data, and by identity for
/// plain containers, views, store nodes and foreign objects.

#pragma once

#include <live_tree/api.h>
#include <live_tree/store.h>
#include <live_tree/value.h>
#include <live_tree/view.h>

#include <tsl/robin_map.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace live_tree {

struct JsonMap;
struct JsonArray;

using JsonMapPtr   = std::shared_ptr<JsonMap>;
using JsonArrayPtr = std::shared_ptr<JsonArray>;

/// A host object the layer does not understand
struct Foreign {
    std::shared_ptr<const void> object;
    std::string type_name;

    bool operator==(const Foreign& other) const noexcept { return object == other.object; }
};

struct LIVE_TREE_API Data {
    using Variant = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 ByteBuffer,
                                 JsonMapPtr,
                                 JsonArrayPtr,
                                 Value,
                                 MapView,
                                 ArrayView,
                                 SharedMapPtr,
                                 SharedArrayPtr,
                                 Foreign>;

    Variant data;

    Data() noexcept : data(std::monostate{}) {}
    Data(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Data(bool v) noexcept : data(std::in_place_type<bool>, v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Data(T v) noexcept : data(std::in_place_type<int64_t>, static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    Data(T v) noexcept : data(std::in_place_type<double>, static_cast<double>(v)) {}

    Data(const char* v) : data(std::in_place_type<std::string>, v) {}
    Data(std::string v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    Data(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Data(ByteBuffer v) noexcept : data(std::in_place_type<ByteBuffer>, std::move(v)) {}
    Data(JsonMapPtr v) noexcept : data(std::move(v)) {}
    Data(JsonArrayPtr v) noexcept : data(std::move(v)) {}
    Data(Value v) noexcept : data(std::in_place_type<Value>, std::move(v)) {}
    Data(MapView v) noexcept : data(v) {}
    Data(ArrayView v) noexcept : data(v) {}
    Data(SharedMapPtr v) noexcept : data(std::move(v)) {}
    Data(SharedArrayPtr v) noexcept : data(std::move(v)) {}
    Data(Foreign v) noexcept : data(std::move(v)) {}

    /// New plain map
    static Data map(std::initializer_list<std::pair<std::string, Data>> init = {});
    /// New plain sequence
    static Data array(std::initializer_list<Data> init = {});

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_bytes() const noexcept { return is<ByteBuffer>(); }
    [[nodiscard]] bool is_plain_map() const noexcept { return is<JsonMapPtr>(); }
    [[nodiscard]] bool is_plain_array() const noexcept { return is<JsonArrayPtr>(); }
    [[nodiscard]] bool is_value() const noexcept { return is<Value>(); }
    [[nodiscard]] bool is_map_view() const noexcept { return is<MapView>(); }
    [[nodiscard]] bool is_array_view() const noexcept { return is<ArrayView>(); }
    [[nodiscard]] bool is_view() const noexcept { return is_map_view() || is_array_view(); }
    [[nodiscard]] bool is_store_node() const noexcept { return is<SharedMapPtr>() || is<SharedArrayPtr>(); }
    [[nodiscard]] bool is_foreign() const noexcept { return is<Foreign>(); }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const noexcept {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const noexcept {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    /// @throws AccessError(NotAView) unless this holds a MapView
    [[nodiscard]] MapView as_map() const;
    /// @throws AccessError(NotAView) unless this holds an ArrayView
    [[nodiscard]] ArrayView as_array() const;

    [[nodiscard]] JsonMapPtr as_plain_map() const noexcept {
        if (auto* p = get_if<JsonMapPtr>()) return *p;
        return nullptr;
    }

    [[nodiscard]] JsonArrayPtr as_plain_array() const noexcept {
        if (auto* p = get_if<JsonArrayPtr>()) return *p;
        return nullptr;
    }

    friend bool operator==(const Data& a, const Data& b) { return a.data == b.data; }
};

// ============================================================
// Plain containers
// ============================================================

struct DataStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

struct DataStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/// Mutable plain map (robin_map: use it.value() to modify through an iterator)
struct JsonMap : tsl::robin_map<std::string, Data, DataStringHash, DataStringEqual> {
    using robin_map::robin_map;
};

/// Mutable plain sequence
struct JsonArray : std::vector<Data> {
    using vector::vector;
};

/// Property definition passed to define_property(). Accessor definitions
/// (getter or setter present) are rejected by views.
struct PropertyDescriptor {
    std::optional<Data> value;
    std::function<Data()> getter;
    std::function<void(const Data&)> setter;
    std::optional<bool> writable;
    std::optional<bool> enumerable;
    std::optional<bool> configurable;

    [[nodiscard]] bool is_accessor() const noexcept {
        return static_cast<bool>(getter) || static_cast<bool>(setter);
    }
};

// ============================================================
// Free functions
// ============================================================

/// Frozen copy of any convertible Data (views and store nodes included)
/// @throws ConversionError(UnsupportedType) for foreign objects
/// @throws ConversionError(CyclicStructure) for cyclic plain containers
[[nodiscard]] LIVE_TREE_API Value to_value(const Data& data);

/// Fresh plain tree (JsonMap / JsonArray) built from a frozen Value
[[nodiscard]] LIVE_TREE_API Data from_value(const Value& value);

/// Primitive Value as primitive Data; containers stay raw (Data holding the Value)
[[nodiscard]] LIVE_TREE_API Data shallow_from_value(const Value& value);

/// Structural equality of a Data (of any kind) against a frozen Value
[[nodiscard]] LIVE_TREE_API bool deep_equal(const Data& data, const Value& expected);

/// Default ordering used by ArrayView::sort()
[[nodiscard]] LIVE_TREE_API bool default_less(const Data& a, const Data& b);

/// Short debug representation
[[nodiscard]] LIVE_TREE_API std::string data_to_string(const Data& data);

} // namespace live_tree
