// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_view.cpp
/// @brief ArrayView operations
///
/// push/pop/shift/unshift/splice write to the store directly. fill,
/// copy_within, reverse and sort compute the new items and go through
/// splice(), so they share its alias fan-out and rollback handling.

#include "session_impl.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace live_tree {

using detail::ConvertedWrite;
using detail::session_or_throw;
using detail::ViewSlot;

namespace {

/// Longest sequence the property protocol accepts; indices stay below it
constexpr std::size_t kMaxLength = 4294967295u;

/// Negative indices count from the end; the result is clamped to [0, length]
std::size_t normalize_index(std::ptrdiff_t index, std::size_t length) noexcept {
    const auto len = static_cast<std::ptrdiff_t>(length);
    if (index < 0) return static_cast<std::size_t>(std::max<std::ptrdiff_t>(len + index, 0));
    return static_cast<std::size_t>(std::min(index, len));
}

std::size_t slot_size(const ViewSlot& slot) {
    if (auto* node = std::get_if<SharedArrayPtr>(&slot.backing)) return (*node)->size();
    return std::get<JsonArrayPtr>(slot.backing)->size();
}

/// Canonical array index ("0", "17"; not "01", "-1" or "1.5")
std::optional<std::size_t> parse_index(std::string_view text) noexcept {
    if (text.empty() || (text.size() > 1 && text.front() == '0')) return std::nullopt;
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
    if (ec != std::errc{} || ptr != text.data() + text.size() || index >= kMaxLength) return std::nullopt;
    return index;
}

std::optional<std::size_t> index_key(const PropertyKey& key) noexcept {
    if (auto* index = std::get_if<std::size_t>(&key)) {
        if (*index >= kMaxLength) return std::nullopt;
        return *index;
    }
    if (auto* name = std::get_if<std::string>(&key)) return parse_index(*name);
    return std::nullopt;
}

bool is_length_key(const PropertyKey& key) noexcept {
    auto* name = std::get_if<std::string>(&key);
    return name && *name == "length";
}

std::size_t parse_length(const Data& value) {
    if (!value.is_number()) {
        throw std::invalid_argument("invalid sequence length: " + data_to_string(value));
    }
    const double length = value.as_number();
    if (!std::isfinite(length) || length < 0 || std::floor(length) != length ||
        length > static_cast<double>(kMaxLength)) {
        throw std::invalid_argument("invalid sequence length: " + data_to_string(value));
    }
    return static_cast<std::size_t>(length);
}

void check_length(std::string_view op, std::size_t length) {
    if (length > kMaxLength) {
        throw std::invalid_argument(std::string(op) + ": invalid sequence length " + std::to_string(length));
    }
}

[[noreturn]] void throw_custom_key(std::string_view op, const PropertyKey& key) {
    detail::log_key_error(op, detail::describe_key(key), "is not an index or 'length'");
    throw AccessError(AccessFailure::UnsupportedProperty,
                      "sequences do not support custom properties: " + detail::describe_key(key));
}

} // anonymous namespace

// ============================================================
// Reads
// ============================================================

std::size_t ArrayView::size() const {
    auto& session = session_or_throw(session_, "ArrayView::size");
    return slot_size(session.resolve(slot_, generation_, "ArrayView::size"));
}

Data ArrayView::at(std::size_t index) const {
    auto& session = session_or_throw(session_, "ArrayView::at");
    auto& slot = session.resolve(slot_, generation_, "ArrayView::at");

    if (auto* node = std::get_if<SharedArrayPtr>(&slot.backing)) {
        auto array = *node;
        if (index >= array->size()) return Data{};
        return session.from_store(array->items()[index]);
    }
    auto snapshot = std::get<JsonArrayPtr>(slot.backing);
    if (index >= snapshot->size()) return Data{};
    return session.from_snapshot((*snapshot)[index]);
}

std::vector<Data> ArrayView::slice(std::ptrdiff_t start, std::optional<std::ptrdiff_t> end) const {
    const auto length = size();
    const auto first = normalize_index(start, length);
    const auto last = end ? normalize_index(*end, length) : length;

    std::vector<Data> result;
    for (auto i = first; i < last; ++i) {
        result.push_back(at(i));
    }
    return result;
}

std::vector<Data> ArrayView::items() const {
    return slice();
}

std::optional<std::size_t> ArrayView::index_of(const Data& value) const {
    const auto length = size();
    for (std::size_t i = 0; i < length; ++i) {
        if (at(i) == value) return i;
    }
    return std::nullopt;
}

// ============================================================
// Index writes
// ============================================================

void ArrayView::set(std::size_t index, const Data& value) const {
    if (index >= kMaxLength) {
        throw std::invalid_argument("ArrayView::set: index " + std::to_string(index) + " is past the longest sequence");
    }
    auto& session = session_or_throw(session_, "ArrayView::set");
    auto& slot = session.resolve(slot_, generation_, "ArrayView::set");
    const auto length = slot_size(slot);

    if (auto* node = std::get_if<SharedArrayPtr>(&slot.backing);
        node && index < length && session.same_content((*node)->items()[index], value)) {
        return;
    }

    if (session.can_log_inverse()) {
        const ArrayView self = *this;
        if (index < length) {
            session.log_inverse([self, index, old = at(index)] { self.set(index, old); });
        } else {
            session.log_inverse([self, length] { self.resize(length); });
        }
    }

    ConvertedWrite write(session, {value});
    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            auto content = write.take_one();
            const auto n = array.size();
            std::vector<Content> values;
            if (index < n) {
                session.detach_content(array.items()[index]);
                array.erase(index, 1);
                values.push_back(std::move(content));
                array.insert(index, std::move(values));
            } else {
                values.assign(index - n, Content{Value{}});
                values.push_back(std::move(content));
                array.insert(n, std::move(values));
            }
        },
        [&](JsonArray& json) {
            auto pure = session.purify(value);
            if (index >= json.size()) json.resize(index + 1);
            json[index] = std::move(pure);
        },
        &write);
}

bool ArrayView::erase(std::size_t index) const {
    auto& session = session_or_throw(session_, "ArrayView::erase");
    auto& slot = session.resolve(slot_, generation_, "ArrayView::erase");
    if (index >= slot_size(slot)) return false;

    if (auto* node = std::get_if<SharedArrayPtr>(&slot.backing)) {
        if (detail::is_null_content((*node)->items()[index])) return false;
    } else if ((*std::get<JsonArrayPtr>(slot.backing))[index].is_null()) {
        return false;
    }

    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, index, old = at(index)] { self.set(index, old); });
    }

    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            if (index >= array.size() || detail::is_null_content(array.items()[index])) return;
            session.detach_content(array.items()[index]);
            array.erase(index, 1);
            array.insert(index, std::vector<Content>{Content{Value{}}});
        },
        [&](JsonArray& json) {
            if (index < json.size()) json[index] = Data{};
        });
    return true;
}

void ArrayView::resize(std::size_t length) const {
    check_length("ArrayView::resize", length);
    auto& session = session_or_throw(session_, "ArrayView::resize");
    const auto old_length = slot_size(session.resolve(slot_, generation_, "ArrayView::resize"));
    if (length == old_length) return;

    if (session.can_log_inverse()) {
        const ArrayView self = *this;
        if (length < old_length) {
            session.log_inverse([self, removed = slice(static_cast<std::ptrdiff_t>(length))] {
                self.append(removed);
            });
        } else {
            session.log_inverse([self, old_length] { self.resize(old_length); });
        }
    }

    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            const auto n = array.size();
            if (length < n) {
                for (auto i = length; i < n; ++i) {
                    session.detach_content(array.items()[i]);
                }
                array.erase(length, n - length);
            } else if (length > n) {
                array.insert(n, std::vector<Content>(length - n, Content{Value{}}));
            }
        },
        [&](JsonArray& json) { json.resize(length); });
}

// ============================================================
// Stack / queue operations
// ============================================================

std::size_t ArrayView::push_back(const Data& value) const {
    return append({value});
}

std::size_t ArrayView::append(const std::vector<Data>& values) const {
    auto& session = session_or_throw(session_, "ArrayView::append");
    const auto length = slot_size(session.resolve(slot_, generation_, "ArrayView::append"));
    if (values.empty()) return length;

    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, length] { self.resize(length); });
    }

    ConvertedWrite write(session, values);
    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) { array.insert(array.size(), write.take()); },
        [&](JsonArray& json) {
            std::vector<Data> pure;
            pure.reserve(values.size());
            for (const auto& value : values) {
                pure.push_back(session.purify(value));
            }
            json.insert(json.end(), pure.begin(), pure.end());
        },
        &write);
    return size();
}

Data ArrayView::pop_back() const {
    auto& session = session_or_throw(session_, "ArrayView::pop_back");
    const auto length = slot_size(session.resolve(slot_, generation_, "ArrayView::pop_back"));
    if (length == 0) return Data{};

    auto last = at(length - 1);
    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, last] { self.push_back(last); });
    }

    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            const auto n = array.size();
            if (n == 0) return;
            session.detach_content(array.items()[n - 1]);
            array.erase(n - 1, 1);
        },
        [&](JsonArray& json) {
            if (!json.empty()) json.pop_back();
        });
    return last;
}

std::size_t ArrayView::push_front(const Data& value) const {
    return prepend({value});
}

std::size_t ArrayView::prepend(const std::vector<Data>& values) const {
    auto& session = session_or_throw(session_, "ArrayView::prepend");
    const auto length = slot_size(session.resolve(slot_, generation_, "ArrayView::prepend"));
    if (values.empty()) return length;

    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, count = values.size()] { self.splice(0, count); });
    }

    ConvertedWrite write(session, values);
    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) { array.insert(0, write.take()); },
        [&](JsonArray& json) {
            std::vector<Data> pure;
            pure.reserve(values.size());
            for (const auto& value : values) {
                pure.push_back(session.purify(value));
            }
            json.insert(json.begin(), pure.begin(), pure.end());
        },
        &write);
    return size();
}

Data ArrayView::pop_front() const {
    auto& session = session_or_throw(session_, "ArrayView::pop_front");
    const auto length = slot_size(session.resolve(slot_, generation_, "ArrayView::pop_front"));
    if (length == 0) return Data{};

    auto first = at(0);
    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, first] { self.push_front(first); });
    }

    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            if (array.size() == 0) return;
            session.detach_content(array.items()[0]);
            array.erase(0, 1);
        },
        [&](JsonArray& json) {
            if (!json.empty()) json.erase(json.begin());
        });
    return first;
}

// ============================================================
// Splice and friends
// ============================================================

std::vector<Data> ArrayView::splice(std::ptrdiff_t start) const {
    return splice(start, std::numeric_limits<std::size_t>::max(), {});
}

std::vector<Data> ArrayView::splice(std::ptrdiff_t start, std::size_t delete_count) const {
    return splice(start, delete_count, {});
}

std::vector<Data> ArrayView::splice(std::ptrdiff_t start, std::size_t delete_count,
                                    const std::vector<Data>& items) const {
    auto& session = session_or_throw(session_, "ArrayView::splice");
    const auto length = slot_size(session.resolve(slot_, generation_, "ArrayView::splice"));
    const auto first = normalize_index(start, length);
    const auto count = std::min(delete_count, length - first);
    if (count == 0 && items.empty()) return {};

    auto deleted = slice(static_cast<std::ptrdiff_t>(first), static_cast<std::ptrdiff_t>(first + count));
    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, first, inserted = items.size(), deleted] {
            self.splice(static_cast<std::ptrdiff_t>(first), inserted, deleted);
        });
    }

    ConvertedWrite write(session, items);
    session.apply_to_all_aliases<SharedArray, JsonArray>(
        slot_,
        [&](SharedArray& array) {
            auto converted = write.take();
            const auto n = array.size();
            const auto offset = std::min(first, n);
            const auto removed = std::min(count, n - offset);
            for (auto i = offset; i < offset + removed; ++i) {
                session.detach_content(array.items()[i]);
            }
            array.erase(offset, removed);
            array.insert(offset, std::move(converted));
        },
        [&](JsonArray& json) {
            std::vector<Data> pure;
            pure.reserve(items.size());
            for (const auto& item : items) {
                pure.push_back(session.purify(item));
            }
            const auto offset = std::min(first, json.size());
            const auto removed = std::min(count, json.size() - offset);
            auto pos = json.begin() + static_cast<std::ptrdiff_t>(offset);
            pos = json.erase(pos, pos + static_cast<std::ptrdiff_t>(removed));
            json.insert(pos, pure.begin(), pure.end());
        },
        &write);
    return deleted;
}

void ArrayView::insert(std::size_t index, const std::vector<Data>& items) const {
    splice(static_cast<std::ptrdiff_t>(std::min(index, size())), 0, items);
}

void ArrayView::fill(const Data& value, std::ptrdiff_t start, std::optional<std::ptrdiff_t> end) const {
    const auto length = size();
    const auto first = normalize_index(start, length);
    const auto last = end ? normalize_index(*end, length) : length;
    if (last <= first) return;

    auto current = slice(static_cast<std::ptrdiff_t>(first), static_cast<std::ptrdiff_t>(last));
    if (std::all_of(current.begin(), current.end(), [&](const Data& item) { return item == value; })) {
        return;
    }
    splice(static_cast<std::ptrdiff_t>(first), last - first, std::vector<Data>(last - first, value));
}

void ArrayView::copy_within(std::ptrdiff_t target, std::ptrdiff_t start, std::optional<std::ptrdiff_t> end) const {
    const auto length = size();
    const auto to = normalize_index(target, length);
    const auto from = normalize_index(start, length);
    const auto last = end ? normalize_index(*end, length) : length;
    if (last <= from || to == from || to >= length) return;

    const auto count = std::min(last - from, length - to);
    auto values = slice(static_cast<std::ptrdiff_t>(from), static_cast<std::ptrdiff_t>(from + count));
    auto current = slice(static_cast<std::ptrdiff_t>(to), static_cast<std::ptrdiff_t>(to + count));
    if (values == current) return;
    splice(static_cast<std::ptrdiff_t>(to), count, values);
}

void ArrayView::reverse() const {
    auto current = items();
    if (current.size() < 2) return;

    auto reversed = current;
    std::reverse(reversed.begin(), reversed.end());
    if (reversed == current) return;
    splice(0, current.size(), reversed);
}

void ArrayView::sort() const {
    sort(default_less);
}

void ArrayView::sort(const DataCompare& less) const {
    auto current = items();
    auto sorted = current;
    std::stable_sort(sorted.begin(), sorted.end(), less);
    if (sorted == current) return;
    splice(0, current.size(), sorted);
}

// ============================================================
// Property protocol
// ============================================================

Data ArrayView::get_property(const PropertyKey& key) const {
    if (is_length_key(key)) return Data{static_cast<int64_t>(size())};
    if (auto index = index_key(key)) return at(*index);
    session_or_throw(session_, "ArrayView::get_property").resolve(slot_, generation_, "ArrayView::get_property");
    return Data{};
}

void ArrayView::set_property(const PropertyKey& key, const Data& value) const {
    if (is_length_key(key)) {
        resize(parse_length(value));
        return;
    }
    if (auto index = index_key(key)) {
        set(*index, value);
        return;
    }
    throw_custom_key("ArrayView::set_property", key);
}

bool ArrayView::delete_property(const PropertyKey& key) const {
    if (auto index = index_key(key)) return erase(*index);
    return false;
}

void ArrayView::define_property(const PropertyKey& key, const PropertyDescriptor& descriptor) const {
    if (descriptor.is_accessor()) {
        detail::log_key_error("ArrayView::define_property", detail::describe_key(key), "accessor definition");
        throw AccessError(AccessFailure::AccessorDefinition,
                          "getter/setter definitions are not supported on views");
    }

    if (is_length_key(key)) {
        if (descriptor.configurable.value_or(false) || descriptor.enumerable.value_or(false) ||
            !descriptor.writable.value_or(true)) {
            throw AccessError(AccessFailure::UnsupportedProperty,
                              "'length' must stay writable, non-enumerable and non-configurable");
        }
        if (descriptor.value) resize(parse_length(*descriptor.value));
        return;
    }

    if (auto index = index_key(key)) {
        if (!descriptor.configurable.value_or(true) || !descriptor.enumerable.value_or(true) ||
            !descriptor.writable.value_or(true)) {
            throw AccessError(AccessFailure::UnsupportedProperty,
                              "sequence items must stay writable, enumerable and configurable");
        }
        set(*index, descriptor.value.value_or(Data{}));
        return;
    }

    throw_custom_key("ArrayView::define_property", key);
}

bool ArrayView::has_property(const PropertyKey& key) const {
    if (is_length_key(key)) return true;
    if (auto index = index_key(key)) return *index < size();
    return false;
}

std::vector<PropertyKey> ArrayView::own_keys() const {
    std::vector<PropertyKey> result;
    const auto length = size();
    for (std::size_t i = 0; i < length; ++i) {
        result.emplace_back(std::to_string(i));
    }
    result.emplace_back(std::string("length"));
    return result;
}

// ============================================================
// State
// ============================================================

bool ArrayView::is_attached() const {
    auto& session = session_or_throw(session_, "ArrayView::is_attached");
    return session.resolve(slot_, generation_, "ArrayView::is_attached").attached();
}

Value ArrayView::to_json() const {
    auto& session = session_or_throw(session_, "ArrayView::to_json");
    auto& slot = session.resolve(slot_, generation_, "ArrayView::to_json");
    if (auto node = slot.node()) return node->to_plain();
    return to_value(slot.snapshot());
}

bool ArrayView::valid() const noexcept {
    return session_ != nullptr && session_->valid(slot_, generation_);
}

} // namespace live_tree
