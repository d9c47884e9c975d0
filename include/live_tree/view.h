// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file view.h
/// @brief Live view handles over store maps and sequences.
///
/// A view is a small copyable handle {session, slot, generation}. The slot
/// lives in the Session's arena and is either
///   - attached: backed by a store node; reads and writes go to the store, or
///   - detached: backed by a plain snapshot owned by the view.
///
/// Every operation re-validates the handle. Once the scope that produced a
/// view closes (or is invalidated by a foreign change) the slot generation
/// moves on and the handle throws AccessError(Revoked) from then on.
/// Handles share a pin with their slot; a slot no handle pins any more is
/// reclaimed by the session's periodic sweep.
///
/// Handles have shallow constness: a const MapView can still write through
/// to the tree it refers to.
///
/// @code
///   session.with_views(doc.get_map("root"), [](MapView root) {
///       root.set("point", Data::map({{"x", 1}, {"y", 2}}));
///       auto point = root.get("point").as_map();
///       point.set("x", 10);
///   });
/// @endcode

#pragma once

#include <live_tree/api.h>
#include <live_tree/value.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace live_tree {

struct Data;
struct PropertyDescriptor;

namespace detail {
class SessionImpl;
} // namespace detail

/// Non-string property key. Never accepted by views.
struct Symbol {
    std::string description;

    bool operator==(const Symbol&) const = default;
};

/// Key of the generic property protocol
using PropertyKey = std::variant<std::string, std::size_t, Symbol>;

using DataCompare = std::function<bool(const Data&, const Data&)>;

// ============================================================
// MapView
// ============================================================

class LIVE_TREE_API MapView {
public:
    /// An empty handle; every operation throws AccessError(Revoked)
    MapView() noexcept = default;

    /// Value at key, null when absent
    [[nodiscard]] Data get(std::string_view key) const;
    void set(std::string_view key, const Data& value) const;
    /// @return true if the key existed
    bool erase(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::pair<std::string, Data>> entries() const;

    // Generic property protocol
    [[nodiscard]] Data get_property(const PropertyKey& key) const;
    void set_property(const PropertyKey& key, const Data& value) const;
    bool delete_property(const PropertyKey& key) const;
    void define_property(const PropertyKey& key, const PropertyDescriptor& descriptor) const;
    [[nodiscard]] bool has_property(const PropertyKey& key) const;
    [[nodiscard]] std::vector<PropertyKey> own_keys() const;

    [[nodiscard]] bool is_attached() const;
    [[nodiscard]] Value to_json() const;

    /// False once the handle has been revoked
    [[nodiscard]] bool valid() const noexcept;

    friend bool operator==(const MapView&, const MapView&) = default;

private:
    friend class detail::SessionImpl;

    MapView(detail::SessionImpl* session, std::uint32_t slot, std::uint32_t generation,
            std::shared_ptr<const void> pin) noexcept
        : session_(session), slot_(slot), generation_(generation), pin_(std::move(pin)) {}

    detail::SessionImpl* session_ = nullptr;
    std::uint32_t slot_ = 0;
    std::uint32_t generation_ = 0;
    std::shared_ptr<const void> pin_;
};

// ============================================================
// ArrayView
// ============================================================

class LIVE_TREE_API ArrayView {
public:
    ArrayView() noexcept = default;

    [[nodiscard]] std::size_t size() const;
    /// Value at index, null when past the end
    [[nodiscard]] Data at(std::size_t index) const;
    /// Writes past the end pad the gap with null
    void set(std::size_t index, const Data& value) const;
    /// Replaces the slot with null; the length is unchanged
    bool erase(std::size_t index) const;
    /// Truncates (detaching removed items) or pads with null
    void resize(std::size_t length) const;

    /// @return new length
    std::size_t push_back(const Data& value) const;
    std::size_t append(const std::vector<Data>& values) const;
    /// @return removed item, null when empty
    Data pop_back() const;
    std::size_t push_front(const Data& value) const;
    std::size_t prepend(const std::vector<Data>& values) const;
    Data pop_front() const;

    /// Remove delete_count items at start (all when omitted) and insert items.
    /// A negative start counts from the end.
    /// @return removed items
    std::vector<Data> splice(std::ptrdiff_t start) const;
    std::vector<Data> splice(std::ptrdiff_t start, std::size_t delete_count) const;
    std::vector<Data> splice(std::ptrdiff_t start, std::size_t delete_count,
                             const std::vector<Data>& items) const;
    void insert(std::size_t index, const std::vector<Data>& items) const;

    void fill(const Data& value, std::ptrdiff_t start = 0,
              std::optional<std::ptrdiff_t> end = std::nullopt) const;
    void copy_within(std::ptrdiff_t target, std::ptrdiff_t start,
                     std::optional<std::ptrdiff_t> end = std::nullopt) const;
    void reverse() const;
    /// Nulls last, then numbers, strings, and everything else by type
    void sort() const;
    void sort(const DataCompare& less) const;

    [[nodiscard]] std::vector<Data> slice(std::ptrdiff_t start = 0,
                                          std::optional<std::ptrdiff_t> end = std::nullopt) const;
    [[nodiscard]] std::vector<Data> items() const;
    [[nodiscard]] std::optional<std::size_t> index_of(const Data& value) const;

    // Generic property protocol ("length" and numeric keys only)
    [[nodiscard]] Data get_property(const PropertyKey& key) const;
    void set_property(const PropertyKey& key, const Data& value) const;
    bool delete_property(const PropertyKey& key) const;
    void define_property(const PropertyKey& key, const PropertyDescriptor& descriptor) const;
    [[nodiscard]] bool has_property(const PropertyKey& key) const;
    [[nodiscard]] std::vector<PropertyKey> own_keys() const;

    [[nodiscard]] bool is_attached() const;
    [[nodiscard]] Value to_json() const;
    [[nodiscard]] bool valid() const noexcept;

    friend bool operator==(const ArrayView&, const ArrayView&) = default;

private:
    friend class detail::SessionImpl;

    ArrayView(detail::SessionImpl* session, std::uint32_t slot, std::uint32_t generation,
              std::shared_ptr<const void> pin) noexcept
        : session_(session), slot_(slot), generation_(generation), pin_(std::move(pin)) {}

    detail::SessionImpl* session_ = nullptr;
    std::uint32_t slot_ = 0;
    std::uint32_t generation_ = 0;
    std::shared_ptr<const void> pin_;
};

} // namespace live_tree
