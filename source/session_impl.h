// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file session_impl.h
/// @brief Private state behind Session and the view handles.
///
/// Views are {SessionImpl*, slot, generation} handles into an arena of
/// ViewSlots. A slot is backed either by a store node (attached) or by a
/// plain snapshot (detached). The identity cache maps the backing pointer
/// back to the slot, so there is at most one live view per node and per
/// snapshot.
///
/// Slots are reused after revocation; the generation counter makes old
/// handles fail with AccessError(Revoked). Every handle holds the slot's pin,
/// and slots whose pin has expired are swept the way first conversions are.

#pragma once

#include <live_tree/alias_tracker.h>
#include <live_tree/connection.h>
#include <live_tree/data.h>
#include <live_tree/errors.h>
#include <live_tree/log.h>
#include <live_tree/rollback.h>
#include <live_tree/session.h>
#include <live_tree/store.h>
#include <live_tree/view.h>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace live_tree {
namespace detail {

enum class ViewKind { Map, Array };

/// Backing of a view slot. Store nodes first: index() < 2 means attached.
using Backing = std::variant<SharedMapPtr, SharedArrayPtr, JsonMapPtr, JsonArrayPtr>;

struct ViewSlot {
    ViewKind kind = ViewKind::Map;
    std::uint32_t generation = 0;
    bool live = false;
    Backing backing;
    std::weak_ptr<const void> pin; ///< shared by every handle to this generation

    [[nodiscard]] bool attached() const noexcept { return backing.index() < 2; }

    /// Identity cache key: node pointer or snapshot pointer
    [[nodiscard]] const void* key() const noexcept {
        return std::visit([](const auto& ptr) -> const void* { return ptr.get(); }, backing);
    }

    [[nodiscard]] SharedTypePtr node() const {
        if (auto* map = std::get_if<SharedMapPtr>(&backing)) return *map;
        if (auto* arr = std::get_if<SharedArrayPtr>(&backing)) return *arr;
        return nullptr;
    }

    /// The snapshot as Data, null when attached
    [[nodiscard]] Data snapshot() const {
        if (auto* map = std::get_if<JsonMapPtr>(&backing)) return Data{*map};
        if (auto* arr = std::get_if<JsonArrayPtr>(&backing)) return Data{*arr};
        return Data{};
    }
};

/// Per-call state of one plain-to-store conversion.
/// Nothing outside the produced nodes changes until the session commits it.
struct ConversionContext {
    tsl::robin_set<const void*> active;                ///< containers on the current path
    tsl::robin_map<const void*, SharedTypePtr> local;  ///< containers already converted by this call
    tsl::robin_set<const SharedType*> unparented_seen; ///< unparented nodes used by this call

    std::vector<std::pair<SharedTypePtr, SharedTypePtr>> links;                   ///< node aliases to record
    std::vector<std::pair<std::shared_ptr<const void>, SharedTypePtr>> converted; ///< plain source -> node
    tsl::robin_map<const void*, std::uint32_t> attaching;                         ///< snapshot -> detached slot
};

/// First store node produced from a plain container
struct FirstConversion {
    std::weak_ptr<const void> source;
    std::weak_ptr<SharedType> node;
};

enum class ScopeMode { Auto, Manual };

class SessionImpl;
class ConvertedWrite;

/// One open scope. Shared between the session, the ManualContext handles
/// and (in async mode) the pending completion.
class ScopeState {
public:
    SessionImpl* session = nullptr;
    ScopeMode mode = ScopeMode::Auto;
    Origin origin;
    std::vector<Doc*> docs;
    std::vector<std::pair<std::uint32_t, std::uint32_t>> produced; ///< {slot, generation}
    std::optional<RollbackLog> rollback;
    ScopedConnectionList watchers;
    bool invalidated = false;
    bool closed = false;

    /// Foreign change: revoke every produced view and disable rollback
    void invalidate() noexcept;
    /// Replay the rollback log if the scope asked for one and is still valid.
    /// A failing replay is logged; the caller rethrows the body's error.
    void rollback_if_needed() noexcept;
    /// Idempotent teardown
    void close() noexcept;
    /// Session is going away while the scope is still referenced
    void abandon() noexcept;

private:
    void revoke_produced() noexcept;
};

/// Closes a scope when the last owner lets go
struct ScopeCloser {
    std::shared_ptr<ScopeState> state;

    explicit ScopeCloser(std::shared_ptr<ScopeState> s) noexcept : state(std::move(s)) {}
    ScopeCloser(const ScopeCloser&) = delete;
    ScopeCloser& operator=(const ScopeCloser&) = delete;
    ~ScopeCloser() {
        if (state) state->close();
    }
};

class SessionImpl {
public:
    using RootViews = std::vector<Data>;

    SessionImpl() = default;
    ~SessionImpl();

    SessionImpl(const SessionImpl&) = delete;
    SessionImpl& operator=(const SessionImpl&) = delete;

    // ============================================================
    // Identity cache (session.cpp)
    // ============================================================

    /// Cached or new view over a store node
    /// @throws AccessError(Deleted)
    [[nodiscard]] MapView map_view(const SharedMapPtr& node);
    [[nodiscard]] ArrayView array_view(const SharedArrayPtr& node);
    [[nodiscard]] Data view_of(const SharedTypePtr& node);

    /// Cached or new detached view over a snapshot
    [[nodiscard]] Data snapshot_view(const JsonMapPtr& snapshot);
    [[nodiscard]] Data snapshot_view(const JsonArrayPtr& snapshot);

    /// Handle for a live slot
    [[nodiscard]] Data handle_of(std::uint32_t slot);

    /// Validate a handle and return its slot
    /// @throws AccessError(Revoked) / AccessError(Deleted)
    ViewSlot& resolve(std::uint32_t slot, std::uint32_t generation, std::string_view op);
    [[nodiscard]] bool valid(std::uint32_t slot, std::uint32_t generation) const noexcept;

    /// Retire a slot: evict it, unlink its view aliases, bump its generation
    void revoke(std::uint32_t slot, std::uint32_t generation) noexcept;

    /// Revoke live slots no handle pins and no view alias depends on
    void sweep_unpinned_views();

    [[nodiscard]] std::size_t live_view_count() const noexcept { return slots_.size() - free_slots_.size(); }

    /// Slot currently keyed under this backing pointer
    [[nodiscard]] std::optional<std::uint32_t> cached_slot(const void* key) const;

    /// Validated slot of a view of this session held in data, nullopt for anything else
    /// @throws AccessError(Revoked) / AccessError(Deleted) for stale views
    [[nodiscard]] std::optional<std::uint32_t> resolve_view(const Data& data, std::string_view op);

    [[nodiscard]] const ViewSlot& slot_at(std::uint32_t slot) const { return slots_[slot]; }

    [[nodiscard]] std::optional<StoreNode> unwrap(const Data& view);
    [[nodiscard]] Data detached_view(const Data& value, bool clone);
    [[nodiscard]] StoreNode store_from_plain(const Data& value);

    // ============================================================
    // Conversion (conversion.cpp)
    // ============================================================

    /// Store content for a value being written. Aliases and re-attachments
    /// are only recorded in ctx; commit_conversion applies them.
    [[nodiscard]] Content to_store(const Data& value, ConversionContext& ctx);

    /// Record the node aliases of a finished conversion and attach the
    /// detached views whose snapshot it converted
    void commit_conversion(ConversionContext& ctx);

    /// Copy of converted content for another alias target, linked to it
    [[nodiscard]] Content alias_copy(const Content& content);

    /// Read side: Values become primitives/raw, nodes become views
    [[nodiscard]] Data from_store(const Content& content);

    /// Read side of a snapshot entry: nested containers become views
    [[nodiscard]] Data from_snapshot(const Data& entry);

    /// Write side of a detached view: strip views and nodes down to plain data
    [[nodiscard]] Data purify(const Data& value);

    /// Deep copy of a plain tree, keeping shared sub-containers shared
    [[nodiscard]] Data copy_plain(const Data& value);

    /// True when writing value over current would change nothing
    [[nodiscard]] bool same_content(const Content& current, const Data& value) const;

    // ============================================================
    // Attachment (detach.cpp)
    // ============================================================

    /// Turn the view of a node (and of its descendants) into a detached view.
    /// hint: a snapshot the node is known to mirror (used for nested aliases).
    Data detach_node(const SharedTypePtr& node, const Data* hint = nullptr);

    /// Detach the content about to be overwritten or removed, if it is a node
    void detach_content(const Content& content);

    // ============================================================
    // Aliases
    // ============================================================

    AliasTracker aliases;

    [[nodiscard]] bool are_aliased(const Data& a, const Data& b);

    /// Run a write against the slot and every alias of it. When a store node
    /// is among the targets, write is converted before anything changes.
    /// Snapshots are updated next, then each distinct store node inside one
    /// transaction per document, tagged with the scope origin.
    template <typename Node, typename Snapshot, typename StoreFn, typename SnapshotFn>
    void apply_to_all_aliases(std::uint32_t slot, StoreFn&& store_fn, SnapshotFn&& snapshot_fn,
                              ConvertedWrite* write = nullptr);

    // ============================================================
    // Scopes (scope.cpp)
    // ============================================================

    ScopeState* scope = nullptr;

    [[nodiscard]] std::optional<Origin> current_origin() const;
    [[nodiscard]] bool can_log_inverse() const noexcept;
    void log_inverse(RollbackLog::InverseOp op);

    /// fn inside nested transactions over docs
    void transact_all(const std::vector<Doc*>& docs, const std::function<void()>& fn,
                      const std::optional<Origin>& origin);

    void run_auto(const std::vector<StoreNode>& roots, const ScopeOptions& options,
                  const std::function<void(const RootViews&)>& body);
    void run_manual(const std::vector<StoreNode>& roots, const ScopeOptions& options,
                    const std::function<void(const RootViews&, const ManualContext&)>& body);
    [[nodiscard]] std::future<void> run_async(
        const std::vector<StoreNode>& roots, const ScopeOptions& options,
        const std::function<std::future<void>(const RootViews&, ManualContext)>& body);

private:
    std::uint32_t allocate(ViewKind kind, Backing backing);
    void link_with_existing_siblings(std::uint32_t slot, const SharedTypePtr& node);
    /// After slot stops using key, hand the cache entry to a view sibling still on it
    void rekey_to_sibling(std::uint32_t slot, const void* key);

    // detach.cpp
    Data fresh_snapshot(const SharedTypePtr& node);
    void detach_children_along(const SharedTypePtr& node, const Data& snapshot);

    // conversion.cpp
    Content clone_if_parented(const SharedTypePtr& node, ConversionContext& ctx);
    Content view_to_store(std::uint32_t slot, ConversionContext& ctx);
    SharedMapPtr map_to_store(const JsonMapPtr& map, ConversionContext& ctx);
    SharedArrayPtr array_to_store(const JsonArrayPtr& array, ConversionContext& ctx);
    void register_conversion(const std::shared_ptr<const void>& source, const SharedTypePtr& node,
                             ConversionContext& ctx);
    void record_first_conversion(const std::shared_ptr<const void>& source, const SharedTypePtr& node);
    /// Link a clone to its original, nested nodes included
    void link_clone(const SharedTypePtr& original, const SharedTypePtr& copy);
    void rebind_converted_snapshot(const void* key, const SharedTypePtr& node);
    Data purify_impl(const Data& value, tsl::robin_set<const void*>& active);
    Data copy_plain_impl(const Data& value, tsl::robin_map<const void*, Data>& copies,
                         tsl::robin_set<const void*>& active);

    // scope.cpp
    std::shared_ptr<ScopeState> open_scope(const std::vector<StoreNode>& roots, ScopeMode mode,
                                           const ScopeOptions& options, RootViews& views);

    std::deque<ViewSlot> slots_;
    std::vector<std::uint32_t> free_slots_;
    tsl::robin_map<const void*, std::uint32_t> identity_;
    tsl::robin_map<const void*, FirstConversion> first_conversions_;
    std::size_t conversions_since_sweep_ = 0;
    std::size_t allocations_since_sweep_ = 0;
};

/// The values of one write, converted once before any alias is touched.
/// The first store target takes the converted content and commits the
/// conversion; later targets get linked copies of it.
class ConvertedWrite {
public:
    ConvertedWrite(SessionImpl& session, std::vector<Data> values)
        : session_(session), values_(std::move(values)) {}

    /// @throws ConversionError / AccessError; nothing has changed when it does
    void convert();

    [[nodiscard]] std::vector<Content> take();
    [[nodiscard]] Content take_one() { return std::move(take().front()); }

private:
    SessionImpl& session_;
    std::vector<Data> values_;
    ConversionContext ctx_;
    std::vector<Content> contents_;
    bool converted_ = false;
    bool committed_ = false;
};

// ============================================================
// Helpers shared by the view implementations
// ============================================================

/// Session behind a handle; default-constructed handles count as revoked
inline SessionImpl& session_or_throw(SessionImpl* session, std::string_view op) {
    if (!session) {
        log_access_error(op, "empty view handle");
        throw AccessError(AccessFailure::Revoked, std::string(op) + ": empty view handle");
    }
    return *session;
}

inline std::string describe_key(const PropertyKey& key) {
    if (auto* name = std::get_if<std::string>(&key)) return *name;
    if (auto* index = std::get_if<std::size_t>(&key)) return std::to_string(*index);
    return "Symbol(" + std::get<Symbol>(key).description + ")";
}

[[nodiscard]] inline bool is_null_content(const Content& content) noexcept {
    auto* value = std::get_if<Value>(&content);
    return value && value->is_null();
}

[[nodiscard]] inline Content as_content(const SharedTypePtr& node) {
    if (node->kind() == NodeKind::Map) return std::static_pointer_cast<SharedMap>(node);
    return std::static_pointer_cast<SharedArray>(node);
}

[[nodiscard]] inline Backing as_backing(const SharedTypePtr& node) {
    if (node->kind() == NodeKind::Map) return std::static_pointer_cast<SharedMap>(node);
    return std::static_pointer_cast<SharedArray>(node);
}

// ============================================================
// Template implementation
// ============================================================

template <typename Node, typename Snapshot, typename StoreFn, typename SnapshotFn>
void SessionImpl::apply_to_all_aliases(std::uint32_t slot, StoreFn&& store_fn, SnapshotFn&& snapshot_fn,
                                       ConvertedWrite* write) {
    std::vector<std::shared_ptr<Node>> nodes;
    std::vector<std::shared_ptr<Snapshot>> snapshots;

    auto add_node = [&nodes](const std::shared_ptr<Node>& node) {
        if (!node || node->is_deleted()) return;
        if (std::find(nodes.begin(), nodes.end(), node) == nodes.end()) nodes.push_back(node);
    };

    auto collect = [&](std::uint32_t index) {
        const auto& target = slots_[index];
        if (!target.live) return;
        if (auto* node = std::get_if<std::shared_ptr<Node>>(&target.backing)) {
            add_node(*node);
            for (const auto& sibling : aliases.node_siblings(**node)) {
                add_node(std::dynamic_pointer_cast<Node>(sibling));
            }
        } else if (auto* snapshot = std::get_if<std::shared_ptr<Snapshot>>(&target.backing)) {
            if (std::find(snapshots.begin(), snapshots.end(), *snapshot) == snapshots.end()) {
                snapshots.push_back(*snapshot);
            }
        }
    };

    collect(slot);
    for (auto sibling : aliases.view_siblings(slot)) {
        collect(sibling);
    }

    if (write && !nodes.empty()) write->convert();
    for (const auto& snapshot : snapshots) {
        snapshot_fn(*snapshot);
    }
    if (nodes.empty()) return;

    std::vector<Doc*> docs;
    for (const auto& node : nodes) {
        if (auto* doc = node->doc(); doc && std::find(docs.begin(), docs.end(), doc) == docs.end()) {
            docs.push_back(doc);
        }
    }
    transact_all(docs, [&] {
        for (const auto& node : nodes) {
            // an earlier write may have removed this alias from the tree
            if (!node->is_deleted()) store_fn(*node);
        }
    }, current_origin());
}

} // namespace detail
} // namespace live_tree
