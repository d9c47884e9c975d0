// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file conversion.cpp
/// @brief Value conversion between plain data, views and store content
///
/// Write side (to_store):
/// - primitives and blobs become frozen Values, raw Values pass through
/// - store nodes are inserted as-is when unparented, cloned otherwise
/// - attached views clone their node; detached views convert their snapshot
///   and become attached to the node that snapshot produced
/// - plain containers are converted recursively into fresh nodes
///
/// Aliases, first conversions and re-attachments are collected in the
/// ConversionContext and only applied by commit_conversion, so a write that
/// fails halfway leaves the session as it was.
///
/// Read side (from_store): Values become primitives (containers stay raw),
/// nodes become their cached view.

#include "session_impl.h"

namespace live_tree {
namespace detail {

namespace {

constexpr std::size_t kSweepInterval = 256;

struct ActivePath {
    tsl::robin_set<const void*>& active;
    const void* key;

    ActivePath(tsl::robin_set<const void*>& set, const void* k) : active(set), key(k) {
        if (!active.insert(key).second) {
            throw ConversionError(ConversionFailure::CyclicStructure, "plain container contains itself");
        }
    }
    ~ActivePath() { active.erase(key); }

    ActivePath(const ActivePath&) = delete;
    ActivePath& operator=(const ActivePath&) = delete;
};

} // anonymous namespace

// ============================================================
// Write side
// ============================================================

Content SessionImpl::to_store(const Data& value, ConversionContext& ctx) {
    if (value.is_null()) return Value{};
    if (auto* b = value.get_if<bool>()) return Value{*b};
    if (auto* i = value.get_if<int64_t>()) return Value{*i};
    if (auto* d = value.get_if<double>()) return Value{*d};
    if (auto* s = value.get_if<std::string>()) return Value{*s};
    if (auto* bytes = value.get_if<ByteBuffer>()) return Value{*bytes};
    if (auto* raw = value.get_if<Value>()) return *raw;

    if (auto* map = value.get_if<SharedMapPtr>()) return clone_if_parented(*map, ctx);
    if (auto* arr = value.get_if<SharedArrayPtr>()) return clone_if_parented(*arr, ctx);

    if (value.is_view()) {
        auto slot = resolve_view(value, "convert");
        return view_to_store(*slot, ctx);
    }

    if (auto* map = value.get_if<JsonMapPtr>()) return map_to_store(*map, ctx);
    if (auto* arr = value.get_if<JsonArrayPtr>()) return array_to_store(*arr, ctx);

    const auto& foreign = *value.get_if<Foreign>();
    throw ConversionError(ConversionFailure::UnsupportedType,
                          "cannot store a value of type '" + foreign.type_name + "'");
}

Content SessionImpl::clone_if_parented(const SharedTypePtr& node, ConversionContext& ctx) {
    if (node->is_deleted()) {
        log_access_error("convert", "store node has been deleted");
        throw AccessError(AccessFailure::Deleted, "cannot store a deleted store node");
    }
    if (node->is_parented()) {
        auto copy = node->clone_node();
        ctx.links.emplace_back(node, copy);
        return as_content(copy);
    }
    if (!ctx.unparented_seen.insert(node.get()).second) {
        throw ConversionError(ConversionFailure::CannotCloneUnparented,
                              "the same unparented store node appears twice in one write");
    }
    return as_content(node);
}

Content SessionImpl::view_to_store(std::uint32_t slot, ConversionContext& ctx) {
    auto& target = slots_[slot];
    if (target.attached()) {
        return clone_if_parented(target.node(), ctx);
    }
    // several detached aliases may share one snapshot: this slot is the one
    // to attach to the node the snapshot is about to produce
    ctx.attaching.emplace(target.key(), slot);
    return to_store(target.snapshot(), ctx);
}

SharedMapPtr SessionImpl::map_to_store(const JsonMapPtr& map, ConversionContext& ctx) {
    auto node = SharedMap::create();
    {
        ActivePath path(ctx.active, map.get());
        for (const auto& [key, value] : *map) {
            node->set(key, to_store(value, ctx));
        }
    }
    register_conversion(map, node, ctx);
    return node;
}

SharedArrayPtr SessionImpl::array_to_store(const JsonArrayPtr& array, ConversionContext& ctx) {
    auto node = SharedArray::create();
    {
        ActivePath path(ctx.active, array.get());
        std::vector<Content> items;
        items.reserve(array->size());
        for (const auto& item : *array) {
            items.push_back(to_store(item, ctx));
        }
        node->insert(0, std::move(items));
    }
    register_conversion(array, node, ctx);
    return node;
}

void SessionImpl::register_conversion(const std::shared_ptr<const void>& source, const SharedTypePtr& node,
                                      ConversionContext& ctx) {
    const void* key = source.get();
    if (auto local = ctx.local.find(key); local != ctx.local.end()) {
        ctx.links.emplace_back(local->second, node);
        return;
    }
    ctx.local.emplace(key, node);
    ctx.converted.emplace_back(source, node);
}

void SessionImpl::record_first_conversion(const std::shared_ptr<const void>& source, const SharedTypePtr& node) {
    const void* key = source.get();

    auto it = first_conversions_.find(key);
    if (it != first_conversions_.end()) {
        auto first_source = it->second.source.lock();
        auto first_node = it->second.node.lock();
        if (first_source.get() == key && first_node && !first_node->is_deleted()) {
            aliases.link_nodes(first_node, node);
            return;
        }
        it.value() = FirstConversion{source, node};
        return;
    }

    first_conversions_.emplace(key, FirstConversion{source, node});
    if (++conversions_since_sweep_ >= kSweepInterval) {
        conversions_since_sweep_ = 0;
        for (auto entry = first_conversions_.begin(); entry != first_conversions_.end();) {
            if (entry->second.source.expired() || entry->second.node.expired()) {
                entry = first_conversions_.erase(entry);
            } else {
                ++entry;
            }
        }
    }
}

void SessionImpl::commit_conversion(ConversionContext& ctx) {
    for (const auto& [first, second] : ctx.links) {
        aliases.link_nodes(first, second);
    }
    for (const auto& [source, node] : ctx.converted) {
        record_first_conversion(source, node);

        const void* key = source.get();
        if (auto it = ctx.attaching.find(key); it != ctx.attaching.end()) {
            const auto& target = slots_[it->second];
            if (target.live && target.key() == key) identity_[key] = it->second;
        }
        rebind_converted_snapshot(key, node);
    }
    ctx.links.clear();
    ctx.converted.clear();
    ctx.attaching.clear();
}

Content SessionImpl::alias_copy(const Content& content) {
    auto node = content_node(content);
    if (!node) return content;
    auto copy = node->clone_node();
    link_clone(node, copy);
    return as_content(copy);
}

void SessionImpl::link_clone(const SharedTypePtr& original, const SharedTypePtr& copy) {
    if (!copy) return;
    aliases.link_nodes(original, copy);

    if (original->kind() == NodeKind::Map) {
        const auto& from = static_cast<const SharedMap&>(*original);
        const auto& to = static_cast<const SharedMap&>(*copy);
        for (const auto& [key, content] : from.entries()) {
            auto child = content_node(content);
            const auto* mirrored = to.find(key);
            if (child && mirrored) link_clone(child, content_node(*mirrored));
        }
        return;
    }

    const auto& from = static_cast<const SharedArray&>(*original);
    const auto& to = static_cast<const SharedArray&>(*copy);
    for (std::size_t i = 0; i < from.size() && i < to.size(); ++i) {
        if (auto child = content_node(from.items()[i])) link_clone(child, content_node(to.items()[i]));
    }
}

void SessionImpl::rebind_converted_snapshot(const void* key, const SharedTypePtr& node) {
    auto slot = cached_slot(key);
    if (!slot) return;
    auto& target = slots_[*slot];
    if (target.attached() || target.key() != key) return;

    rekey_to_sibling(*slot, key);
    target.backing = as_backing(node);
    identity_[node.get()] = *slot;
    link_with_existing_siblings(*slot, node);
}

// ============================================================
// ConvertedWrite
// ============================================================

void ConvertedWrite::convert() {
    if (converted_) return;
    contents_.reserve(values_.size());
    for (const auto& value : values_) {
        contents_.push_back(session_.to_store(value, ctx_));
    }
    converted_ = true;
}

std::vector<Content> ConvertedWrite::take() {
    convert();
    if (!committed_) {
        committed_ = true;
        session_.commit_conversion(ctx_);
        return contents_;
    }
    std::vector<Content> copies;
    copies.reserve(contents_.size());
    for (const auto& content : contents_) {
        copies.push_back(session_.alias_copy(content));
    }
    return copies;
}

// ============================================================
// Read side
// ============================================================

Data SessionImpl::from_store(const Content& content) {
    if (auto* value = std::get_if<Value>(&content)) return shallow_from_value(*value);
    return view_of(content_node(content));
}

Data SessionImpl::from_snapshot(const Data& entry) {
    if (auto* map = entry.get_if<JsonMapPtr>()) return snapshot_view(*map);
    if (auto* arr = entry.get_if<JsonArrayPtr>()) return snapshot_view(*arr);
    return entry;
}

bool SessionImpl::same_content(const Content& current, const Data& value) const {
    if (auto node = content_node(current)) {
        auto view_key = [this](SessionImpl* owner, std::uint32_t slot, std::uint32_t generation) -> const void* {
            if (owner != this || !valid(slot, generation)) return nullptr;
            return slots_[slot].key();
        };
        if (auto* map = value.get_if<MapView>()) {
            return view_key(map->session_, map->slot_, map->generation_) == node.get();
        }
        if (auto* arr = value.get_if<ArrayView>()) {
            return view_key(arr->session_, arr->slot_, arr->generation_) == node.get();
        }
        if (auto* map = value.get_if<SharedMapPtr>()) return map->get() == node.get();
        if (auto* arr = value.get_if<SharedArrayPtr>()) return arr->get() == node.get();
        return false;
    }

    const auto& stored = std::get<Value>(current);
    if (auto* raw = value.get_if<Value>()) return *raw == stored;
    if (value.is_null() || value.is_bool() || value.is_number() || value.is_string() || value.is_bytes()) {
        return shallow_from_value(stored) == value;
    }
    return false;
}

// ============================================================
// Plain copies
// ============================================================

Data SessionImpl::purify(const Data& value) {
    tsl::robin_set<const void*> active;
    return purify_impl(value, active);
}

Data SessionImpl::purify_impl(const Data& value, tsl::robin_set<const void*>& active) {
    if (value.is_view()) {
        auto slot = resolve_view(value, "purify");
        const auto& target = slots_[*slot];
        if (target.attached()) return from_value(target.node()->to_plain());
        return target.snapshot();
    }
    if (auto* map = value.get_if<SharedMapPtr>()) return from_value((*map)->to_plain());
    if (auto* arr = value.get_if<SharedArrayPtr>()) return from_value((*arr)->to_plain());
    if (auto* foreign = value.get_if<Foreign>()) {
        throw ConversionError(ConversionFailure::UnsupportedType,
                              "cannot store a value of type '" + foreign->type_name + "'");
    }

    if (auto* map = value.get_if<JsonMapPtr>()) {
        ActivePath path(active, map->get());
        auto copy = std::make_shared<JsonMap>();
        bool changed = false;
        for (const auto& [key, child] : **map) {
            auto pure = purify_impl(child, active);
            changed = changed || !(pure == child);
            copy->insert_or_assign(key, std::move(pure));
        }
        return changed ? Data{std::move(copy)} : value;
    }
    if (auto* arr = value.get_if<JsonArrayPtr>()) {
        ActivePath path(active, arr->get());
        auto copy = std::make_shared<JsonArray>();
        copy->reserve((*arr)->size());
        bool changed = false;
        for (const auto& child : **arr) {
            auto pure = purify_impl(child, active);
            changed = changed || !(pure == child);
            copy->push_back(std::move(pure));
        }
        return changed ? Data{std::move(copy)} : value;
    }
    return value;
}

Data SessionImpl::copy_plain(const Data& value) {
    tsl::robin_map<const void*, Data> copies;
    tsl::robin_set<const void*> active;
    return copy_plain_impl(value, copies, active);
}

Data SessionImpl::copy_plain_impl(const Data& value, tsl::robin_map<const void*, Data>& copies,
                                  tsl::robin_set<const void*>& active) {
    if (auto* map = value.get_if<JsonMapPtr>()) {
        ActivePath path(active, map->get());
        if (auto it = copies.find(map->get()); it != copies.end()) return it->second;
        auto copy = std::make_shared<JsonMap>();
        copies.emplace(map->get(), Data{copy});
        for (const auto& [key, child] : **map) {
            copy->insert_or_assign(key, copy_plain_impl(child, copies, active));
        }
        return Data{std::move(copy)};
    }
    if (auto* arr = value.get_if<JsonArrayPtr>()) {
        ActivePath path(active, arr->get());
        if (auto it = copies.find(arr->get()); it != copies.end()) return it->second;
        auto copy = std::make_shared<JsonArray>();
        copies.emplace(arr->get(), Data{copy});
        copy->reserve((*arr)->size());
        for (const auto& child : **arr) {
            copy->push_back(copy_plain_impl(child, copies, active));
        }
        return Data{std::move(copy)};
    }
    if (value.is_view() || value.is_store_node() || value.is_foreign()) {
        return purify(value);
    }
    return value;
}

} // namespace detail
} // namespace live_tree
