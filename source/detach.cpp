// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file detach.cpp
/// @brief Attached -> detached transition of views whose node leaves the tree
///
/// Before a node is overwritten or removed, its view (and the views of its
/// descendants) switch to a plain snapshot of the node's current value, so
/// callers holding them keep a usable value.
///
/// When the view has a detached alias of the same kind, the two end up
/// sharing that alias' snapshot, nested children included, so later writes
/// through either one stay visible through both.

#include "session_impl.h"

namespace live_tree {
namespace detail {

namespace {

bool kind_matches(const Data& snapshot, NodeKind kind) noexcept {
    return kind == NodeKind::Map ? snapshot.is_plain_map() : snapshot.is_plain_array();
}

} // anonymous namespace

void SessionImpl::detach_content(const Content& content) {
    if (auto node = content_node(content)) {
        detach_node(node);
    }
}

Data SessionImpl::detach_node(const SharedTypePtr& node, const Data* hint) {
    auto slot = cached_slot(node.get());

    Data shared;
    if (slot) {
        const auto kind = slots_[*slot].kind;
        for (auto sibling : aliases.view_siblings(*slot)) {
            const auto& other = slots_[sibling];
            if (other.live && !other.attached() && other.kind == kind) {
                shared = other.snapshot();
                break;
            }
        }
    }
    if (shared.is_null() && hint && kind_matches(*hint, node->kind())) {
        shared = *hint;
    }

    Data snapshot;
    if (!shared.is_null()) {
        detach_children_along(node, shared);
        snapshot = shared;
    } else {
        snapshot = fresh_snapshot(node);
    }

    if (slot) {
        auto& target = slots_[*slot];
        identity_.erase(node.get());
        if (auto map = snapshot.as_plain_map()) {
            target.backing = map;
        } else {
            target.backing = snapshot.as_plain_array();
        }
        const void* key = target.key();
        if (auto existing = cached_slot(key); existing && *existing != *slot) {
            aliases.link_views(*slot, *existing);
        } else {
            identity_[key] = *slot;
        }
    }

    aliases.unlink_node(node->id());
    return snapshot;
}

Data SessionImpl::fresh_snapshot(const SharedTypePtr& node) {
    auto thaw = [this](const Content& content) -> Data {
        if (auto child = content_node(content)) return detach_node(child);
        return shallow_from_value(std::get<Value>(content));
    };

    if (node->kind() == NodeKind::Map) {
        const auto& map = static_cast<const SharedMap&>(*node);
        auto result = std::make_shared<JsonMap>();
        result->reserve(map.size());
        for (const auto& [key, content] : map.entries()) {
            result->insert_or_assign(key, thaw(content));
        }
        return Data{std::move(result)};
    }

    const auto& array = static_cast<const SharedArray&>(*node);
    auto result = std::make_shared<JsonArray>();
    result->reserve(array.size());
    for (const auto& content : array.items()) {
        result->push_back(thaw(content));
    }
    return Data{std::move(result)};
}

void SessionImpl::detach_children_along(const SharedTypePtr& node, const Data& snapshot) {
    auto detach_child = [this](const SharedTypePtr& child, const Data* sub) {
        if (sub && kind_matches(*sub, child->kind())) {
            detach_node(child, sub);
        } else {
            detach_node(child);
        }
    };

    if (node->kind() == NodeKind::Map) {
        const auto& map = static_cast<const SharedMap&>(*node);
        const auto& json = *snapshot.as_plain_map();
        for (const auto& [key, content] : map.entries()) {
            auto child = content_node(content);
            if (!child) continue;
            auto it = json.find(key);
            detach_child(child, it == json.end() ? nullptr : &it->second);
        }
        return;
    }

    const auto& array = static_cast<const SharedArray&>(*node);
    const auto& json = *snapshot.as_plain_array();
    for (std::size_t i = 0; i < array.size(); ++i) {
        auto child = content_node(array.items()[i]);
        if (!child) continue;
        detach_child(child, i < json.size() ? &json[i] : nullptr);
    }
}

} // namespace detail
} // namespace live_tree
