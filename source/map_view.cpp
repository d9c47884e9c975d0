// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file map_view.cpp
/// @brief MapView operations

#include "session_impl.h"

#include <algorithm>

namespace live_tree {

using detail::ConvertedWrite;
using detail::session_or_throw;

Data MapView::get(std::string_view key) const {
    auto& session = session_or_throw(session_, "MapView::get");
    auto& slot = session.resolve(slot_, generation_, "MapView::get");
    const std::string name(key);

    if (auto* node = std::get_if<SharedMapPtr>(&slot.backing)) {
        auto map = *node;
        auto* content = map->find(name);
        return content ? session.from_store(*content) : Data{};
    }
    auto snapshot = std::get<JsonMapPtr>(slot.backing);
    auto it = snapshot->find(name);
    return it == snapshot->end() ? Data{} : session.from_snapshot(it->second);
}

void MapView::set(std::string_view key, const Data& value) const {
    auto& session = session_or_throw(session_, "MapView::set");
    auto& slot = session.resolve(slot_, generation_, "MapView::set");
    const std::string name(key);

    if (auto* node = std::get_if<SharedMapPtr>(&slot.backing)) {
        if (auto* current = (*node)->find(name); current && session.same_content(*current, value)) {
            return;
        }
    }

    if (session.can_log_inverse()) {
        const MapView self = *this;
        if (contains(name)) {
            session.log_inverse([self, name, old = get(name)] { self.set(name, old); });
        } else {
            session.log_inverse([self, name] { self.erase(name); });
        }
    }

    ConvertedWrite write(session, {value});
    session.apply_to_all_aliases<SharedMap, JsonMap>(
        slot_,
        [&](SharedMap& map) {
            auto content = write.take_one();
            if (auto* old = map.find(name)) session.detach_content(*old);
            map.set(name, std::move(content));
        },
        [&](JsonMap& json) { json.insert_or_assign(name, session.purify(value)); },
        &write);
}

bool MapView::erase(std::string_view key) const {
    auto& session = session_or_throw(session_, "MapView::erase");
    session.resolve(slot_, generation_, "MapView::erase");
    const std::string name(key);

    if (!contains(name)) return false;

    if (session.can_log_inverse()) {
        session.log_inverse([self = *this, name, old = get(name)] { self.set(name, old); });
    }

    session.apply_to_all_aliases<SharedMap, JsonMap>(
        slot_,
        [&](SharedMap& map) {
            if (auto* old = map.find(name)) {
                session.detach_content(*old);
                map.erase(name);
            }
        },
        [&](JsonMap& json) { json.erase(name); });
    return true;
}

bool MapView::contains(std::string_view key) const {
    auto& session = session_or_throw(session_, "MapView::contains");
    auto& slot = session.resolve(slot_, generation_, "MapView::contains");
    const std::string name(key);

    if (auto* node = std::get_if<SharedMapPtr>(&slot.backing)) return (*node)->contains(name);
    return std::get<JsonMapPtr>(slot.backing)->count(name) > 0;
}

std::vector<std::string> MapView::keys() const {
    auto& session = session_or_throw(session_, "MapView::keys");
    auto& slot = session.resolve(slot_, generation_, "MapView::keys");

    if (auto* node = std::get_if<SharedMapPtr>(&slot.backing)) return (*node)->keys();

    std::vector<std::string> result;
    const auto& snapshot = *std::get<JsonMapPtr>(slot.backing);
    result.reserve(snapshot.size());
    for (const auto& [name, _] : snapshot) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t MapView::size() const {
    auto& session = session_or_throw(session_, "MapView::size");
    auto& slot = session.resolve(slot_, generation_, "MapView::size");

    if (auto* node = std::get_if<SharedMapPtr>(&slot.backing)) return (*node)->size();
    return std::get<JsonMapPtr>(slot.backing)->size();
}

std::vector<std::pair<std::string, Data>> MapView::entries() const {
    std::vector<std::pair<std::string, Data>> result;
    for (auto& name : keys()) {
        auto value = get(name);
        result.emplace_back(std::move(name), std::move(value));
    }
    return result;
}

// ============================================================
// Property protocol
// ============================================================

Data MapView::get_property(const PropertyKey& key) const {
    if (auto* name = std::get_if<std::string>(&key)) return get(*name);
    session_or_throw(session_, "MapView::get_property").resolve(slot_, generation_, "MapView::get_property");
    return Data{};
}

void MapView::set_property(const PropertyKey& key, const Data& value) const {
    if (auto* name = std::get_if<std::string>(&key)) {
        set(*name, value);
        return;
    }
    detail::log_key_error("MapView::set_property", detail::describe_key(key), "is not a string key");
    throw AccessError(AccessFailure::UnsupportedProperty,
                      "maps only accept string keys, got " + detail::describe_key(key));
}

bool MapView::delete_property(const PropertyKey& key) const {
    if (auto* name = std::get_if<std::string>(&key)) return erase(*name);
    return false;
}

void MapView::define_property(const PropertyKey& key, const PropertyDescriptor& descriptor) const {
    if (descriptor.is_accessor()) {
        detail::log_key_error("MapView::define_property", detail::describe_key(key), "accessor definition");
        throw AccessError(AccessFailure::AccessorDefinition,
                          "getter/setter definitions are not supported on views");
    }
    auto* name = std::get_if<std::string>(&key);
    if (!name) {
        detail::log_key_error("MapView::define_property", detail::describe_key(key), "is not a string key");
        throw AccessError(AccessFailure::UnsupportedProperty,
                          "maps only accept string keys, got " + detail::describe_key(key));
    }
    if (!descriptor.value) {
        throw AccessError(AccessFailure::UnsupportedProperty,
                          "property '" + *name + "' must be defined with a value");
    }
    set(*name, *descriptor.value);
}

bool MapView::has_property(const PropertyKey& key) const {
    if (auto* name = std::get_if<std::string>(&key)) return contains(*name);
    return false;
}

std::vector<PropertyKey> MapView::own_keys() const {
    std::vector<PropertyKey> result;
    for (auto& name : keys()) {
        result.emplace_back(std::move(name));
    }
    return result;
}

// ============================================================
// State
// ============================================================

bool MapView::is_attached() const {
    auto& session = session_or_throw(session_, "MapView::is_attached");
    return session.resolve(slot_, generation_, "MapView::is_attached").attached();
}

Value MapView::to_json() const {
    auto& session = session_or_throw(session_, "MapView::to_json");
    auto& slot = session.resolve(slot_, generation_, "MapView::to_json");
    if (auto node = slot.node()) return node->to_plain();
    return to_value(slot.snapshot());
}

bool MapView::valid() const noexcept {
    return session_ != nullptr && session_->valid(slot_, generation_);
}

} // namespace live_tree
