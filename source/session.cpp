// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file session.cpp
/// @brief Identity cache and the public Session surface

#include "session_impl.h"

namespace live_tree {
namespace detail {

namespace {

constexpr std::size_t kViewSweepInterval = 256;

} // anonymous namespace

// ============================================================
// Identity cache
// ============================================================

SessionImpl::~SessionImpl() {
    if (scope) scope->abandon();
}

std::uint32_t SessionImpl::allocate(ViewKind kind, Backing backing) {
    if (++allocations_since_sweep_ >= kViewSweepInterval) {
        allocations_since_sweep_ = 0;
        sweep_unpinned_views();
    }

    std::uint32_t index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        index = static_cast<std::uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    auto& slot = slots_[index];
    slot.kind = kind;
    slot.live = true;
    slot.backing = std::move(backing);
    identity_[slot.key()] = index;

    if (scope && !scope->closed) {
        scope->produced.emplace_back(index, slot.generation);
    }
    return index;
}

void SessionImpl::link_with_existing_siblings(std::uint32_t slot, const SharedTypePtr& node) {
    for (const auto& sibling : aliases.node_siblings(*node)) {
        if (auto other = cached_slot(sibling.get()); other && *other != slot) {
            aliases.link_views(slot, *other);
        }
    }
}

void SessionImpl::rekey_to_sibling(std::uint32_t slot, const void* key) {
    auto it = identity_.find(key);
    if (it == identity_.end() || it->second != slot) return;
    identity_.erase(it);
    for (auto sibling : aliases.view_siblings(slot)) {
        const auto& other = slots_[sibling];
        if (other.live && other.key() == key) {
            identity_[key] = sibling;
            return;
        }
    }
}

MapView SessionImpl::map_view(const SharedMapPtr& node) {
    auto view = view_of(node);
    return *view.get_if<MapView>();
}

ArrayView SessionImpl::array_view(const SharedArrayPtr& node) {
    auto view = view_of(node);
    return *view.get_if<ArrayView>();
}

Data SessionImpl::view_of(const SharedTypePtr& node) {
    if (!node) {
        throw std::invalid_argument("view_of: null store node");
    }
    if (node->is_deleted()) {
        log_access_error("view_of", "store node has been deleted");
        throw AccessError(AccessFailure::Deleted, "cannot view a deleted store node");
    }
    if (auto hit = cached_slot(node.get())) {
        return handle_of(*hit);
    }

    const auto kind = node->kind() == NodeKind::Map ? ViewKind::Map : ViewKind::Array;
    const auto index = allocate(kind, as_backing(node));
    link_with_existing_siblings(index, node);
    return handle_of(index);
}

Data SessionImpl::snapshot_view(const JsonMapPtr& snapshot) {
    if (auto hit = cached_slot(snapshot.get())) return handle_of(*hit);
    return handle_of(allocate(ViewKind::Map, snapshot));
}

Data SessionImpl::snapshot_view(const JsonArrayPtr& snapshot) {
    if (auto hit = cached_slot(snapshot.get())) return handle_of(*hit);
    return handle_of(allocate(ViewKind::Array, snapshot));
}

Data SessionImpl::handle_of(std::uint32_t slot) {
    auto& target = slots_[slot];
    auto pin = target.pin.lock();
    if (!pin) {
        pin = std::make_shared<std::uint32_t>(slot);
        target.pin = pin;
    }
    if (target.kind == ViewKind::Map) return MapView(this, slot, target.generation, std::move(pin));
    return ArrayView(this, slot, target.generation, std::move(pin));
}

ViewSlot& SessionImpl::resolve(std::uint32_t slot, std::uint32_t generation, std::string_view op) {
    if (!valid(slot, generation)) {
        log_access_error(op, "view has been revoked");
        throw AccessError(AccessFailure::Revoked, std::string(op) + ": view has been revoked");
    }
    auto& target = slots_[slot];
    if (auto node = target.node(); node && node->is_deleted()) {
        log_access_error(op, "backing store node has been deleted");
        throw AccessError(AccessFailure::Deleted, std::string(op) + ": backing store node has been deleted");
    }
    return target;
}

bool SessionImpl::valid(std::uint32_t slot, std::uint32_t generation) const noexcept {
    return slot < slots_.size() && slots_[slot].live && slots_[slot].generation == generation;
}

void SessionImpl::revoke(std::uint32_t slot, std::uint32_t generation) noexcept {
    if (!valid(slot, generation)) return;
    auto& target = slots_[slot];
    rekey_to_sibling(slot, target.key());
    aliases.unlink_view(slot);
    target.live = false;
    ++target.generation;
    target.backing = SharedMapPtr{};
    target.pin.reset();
    free_slots_.push_back(slot);
}

void SessionImpl::sweep_unpinned_views() {
    for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        const auto& target = slots_[index];
        // a detached alias still receives writes made through its siblings
        if (target.live && target.pin.expired() && aliases.view_siblings(index).empty()) {
            revoke(index, target.generation);
        }
    }
}

std::optional<std::uint32_t> SessionImpl::cached_slot(const void* key) const {
    auto it = identity_.find(key);
    if (it == identity_.end() || !slots_[it->second].live) return std::nullopt;
    return it->second;
}

std::optional<std::uint32_t> SessionImpl::resolve_view(const Data& data, std::string_view op) {
    if (auto* map = data.get_if<MapView>(); map && map->session_ == this) {
        resolve(map->slot_, map->generation_, op);
        return map->slot_;
    }
    if (auto* arr = data.get_if<ArrayView>(); arr && arr->session_ == this) {
        resolve(arr->slot_, arr->generation_, op);
        return arr->slot_;
    }
    if (data.is_view()) {
        log_access_error(op, "view belongs to another session");
        throw AccessError(AccessFailure::Revoked, std::string(op) + ": view belongs to another session");
    }
    return std::nullopt;
}

// ============================================================
// Public operations
// ============================================================

std::optional<StoreNode> SessionImpl::unwrap(const Data& view) {
    auto slot = resolve_view(view, "unwrap");
    if (!slot) {
        throw AccessError(AccessFailure::NotAView, "unwrap: " + data_to_string(view) + " is not a view");
    }
    const auto& target = slots_[*slot];
    if (auto* map = std::get_if<SharedMapPtr>(&target.backing)) return StoreNode{*map};
    if (auto* arr = std::get_if<SharedArrayPtr>(&target.backing)) return StoreNode{*arr};
    return std::nullopt;
}

bool SessionImpl::are_aliased(const Data& a, const Data& b) {
    auto first = resolve_view(a, "are_aliased");
    auto second = resolve_view(b, "are_aliased");
    if (!first || !second || *first == *second) return false;
    if (aliases.views_linked(*first, *second)) return true;

    auto node_a = slots_[*first].node();
    auto node_b = slots_[*second].node();
    if (!node_a || !node_b) return false;
    for (const auto& sibling : aliases.node_siblings(*node_a)) {
        if (sibling == node_b) return true;
    }
    return false;
}

Data SessionImpl::detached_view(const Data& value, bool clone) {
    if (value.is_view()) {
        resolve_view(value, "to_detached_view");
        return value;
    }
    if (value.is_store_node()) {
        throw ConversionError(ConversionFailure::AlreadyStoreValue,
                              "to_detached_view: store nodes are viewed with to_view()");
    }

    Data plain;
    if (auto* raw = value.get_if<Value>(); raw && raw->is_container()) {
        plain = from_value(*raw);
    } else if (value.is_plain_map() || value.is_plain_array()) {
        if (clone) {
            plain = copy_plain(value);
        } else {
            plain = value;
            if (auto map = value.as_plain_map()) {
                for (auto it = map->begin(); it != map->end(); ++it) {
                    it.value() = purify(it->second);
                }
            } else {
                for (auto& item : *value.as_plain_array()) {
                    item = purify(item);
                }
            }
        }
    } else {
        throw ConversionError(ConversionFailure::NotAContainer,
                              "to_detached_view: " + data_to_string(value) + " is not a map or sequence");
    }

    if (auto map = plain.as_plain_map()) return snapshot_view(map);
    return snapshot_view(plain.as_plain_array());
}

StoreNode SessionImpl::store_from_plain(const Data& value) {
    if (value.is_view()) {
        throw ConversionError(ConversionFailure::AlreadyView, "to_store: value is already a view");
    }
    if (value.is_store_node()) {
        throw ConversionError(ConversionFailure::AlreadyStoreValue, "to_store: value is already a store node");
    }
    if (!value.is_plain_map() && !value.is_plain_array()) {
        throw ConversionError(ConversionFailure::NotAContainer,
                              "to_store: " + data_to_string(value) + " is not a plain map or sequence");
    }

    ConversionContext ctx;
    auto content = to_store(value, ctx);
    commit_conversion(ctx);
    if (auto* map = std::get_if<SharedMapPtr>(&content)) return *map;
    return std::get<SharedArrayPtr>(content);
}

} // namespace detail

// ============================================================
// Session
// ============================================================

Session::Session() : impl_(std::make_unique<detail::SessionImpl>()) {}

Session::~Session() = default;

bool Session::in_scope() const noexcept {
    return impl_->scope != nullptr;
}

MapView Session::to_view(const SharedMapPtr& node) {
    return impl_->map_view(node);
}

ArrayView Session::to_view(const SharedArrayPtr& node) {
    return impl_->array_view(node);
}

Data Session::to_view(const StoreNode& node) {
    return impl_->view_of(store_node_ptr(node));
}

Data Session::to_detached_view(const Data& value, DetachedViewOptions options) {
    return impl_->detached_view(value, options.clone);
}

StoreNode Session::to_store(const Data& value) {
    return impl_->store_from_plain(value);
}

std::optional<StoreNode> Session::unwrap(const Data& view) const {
    return impl_->unwrap(view);
}

bool Session::are_aliased(const Data& a, const Data& b) const {
    return impl_->are_aliased(a, b);
}

Value Session::to_json(const Data& view) const {
    (void)impl_->resolve_view(view, "to_json");
    if (auto* map = view.get_if<MapView>()) return map->to_json();
    if (auto* arr = view.get_if<ArrayView>()) return arr->to_json();
    throw AccessError(AccessFailure::NotAView, "to_json: " + data_to_string(view) + " is not a view");
}

std::size_t Session::live_view_count() const noexcept {
    return impl_->live_view_count();
}

detail::AliasTracker::Stats Session::alias_stats() const noexcept {
    return impl_->aliases.stats();
}

// ============================================================
// Raw values
// ============================================================

Value mark_raw(const Data& value) {
    return to_value(value);
}

bool is_raw(const Data& value) noexcept {
    auto* raw = value.get_if<Value>();
    return raw && raw->is_container();
}

bool is_view(const Data& value) noexcept {
    return value.is_view();
}

} // namespace live_tree
