// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file session.h
/// @brief Session - registry of live views and entry point of the layer.
///
/// A Session owns everything that ties views to the store:
/// - the identity cache (one live view per store node / per snapshot),
/// - the alias groups (node level and view level),
/// - the first-conversion map (which plain container produced which node),
/// - the currently open scope, if any.
///
/// Views returned by a Session must not outlive it, and a Doc must outlive
/// every scope opened over its nodes. Sessions are single-threaded.
///
/// ## Scopes
///
/// A scope is the window in which views are valid:
///
/// @code
///   Session session;
///   session.with_views(doc.get_map("root"), [](MapView root) {
///       root.set("count", 1);
///   }, {.origin = "editor", .rollback_on_error = true});
/// @endcode
///
/// - with_views(): auto mode. The body runs inside one transaction per
///   document (nested), tagged with the scope origin.
/// - with_views_manual(): the body batches explicitly through
///   ManualContext::transact(). A change committed by any other origin while
///   the scope is open invalidates it: every view it produced is revoked
///   and rollback is disabled.
/// - with_views_async(): manual mode with a body that returns a future.
///   The scope stays open until that future settles.
///
/// Only one scope can be open per session. When the scope closes, every
/// view it produced is revoked and evicted from the identity cache.

#pragma once

#include <live_tree/alias_tracker.h>
#include <live_tree/api.h>
#include <live_tree/data.h>
#include <live_tree/store.h>
#include <live_tree/view.h>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace live_tree {

namespace detail {
class SessionImpl;
class ScopeState;
} // namespace detail

struct ScopeOptions {
    /// Origin tag of the scope's transactions; generated when empty
    std::optional<Origin> origin;
    /// Replay logged inverse operations when the body throws
    bool rollback_on_error = false;
};

struct DetachedViewOptions {
    /// Deep-copy the plain input instead of adopting it as the snapshot
    bool clone = true;
};

/// Handed to manual-mode scope bodies
class LIVE_TREE_API ManualContext {
public:
    /// Run fn in one transaction per document, tagged with the scope origin.
    /// @throws ScopeError(Invalidated) after a foreign change
    /// @throws ScopeError(Closed) after the scope was torn down
    void transact(const std::function<void()>& fn) const;

    [[nodiscard]] bool is_invalidated() const noexcept;
    [[nodiscard]] Origin origin() const;

private:
    friend class detail::SessionImpl;

    explicit ManualContext(std::weak_ptr<detail::ScopeState> state) noexcept : state_(std::move(state)) {}

    std::weak_ptr<detail::ScopeState> state_;
};

class LIVE_TREE_API Session {
public:
    using RootViews = std::vector<Data>;

    Session();
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    // ============================================================
    // Scopes
    // ============================================================

    void with_views(const SharedMapPtr& root, const std::function<void(MapView)>& body,
                    const ScopeOptions& options = {});
    void with_views(const SharedArrayPtr& root, const std::function<void(ArrayView)>& body,
                    const ScopeOptions& options = {});
    /// Views are passed in root order
    void with_views(const std::vector<StoreNode>& roots, const std::function<void(const RootViews&)>& body,
                    const ScopeOptions& options = {});

    void with_views_manual(const SharedMapPtr& root,
                           const std::function<void(MapView, const ManualContext&)>& body,
                           const ScopeOptions& options = {});
    void with_views_manual(const SharedArrayPtr& root,
                           const std::function<void(ArrayView, const ManualContext&)>& body,
                           const ScopeOptions& options = {});
    void with_views_manual(const std::vector<StoreNode>& roots,
                           const std::function<void(const RootViews&, const ManualContext&)>& body,
                           const ScopeOptions& options = {});

    /// The returned future is deferred: waiting on it waits for the body's
    /// future, then runs rollback (on error) and cleanup. Destroying it
    /// unwaited still cleans up.
    [[nodiscard]] std::future<void> with_views_async(
        const SharedMapPtr& root,
        const std::function<std::future<void>(MapView, ManualContext)>& body,
        const ScopeOptions& options = {});
    [[nodiscard]] std::future<void> with_views_async(
        const SharedArrayPtr& root,
        const std::function<std::future<void>(ArrayView, ManualContext)>& body,
        const ScopeOptions& options = {});
    [[nodiscard]] std::future<void> with_views_async(
        const std::vector<StoreNode>& roots,
        const std::function<std::future<void>(const RootViews&, ManualContext)>& body,
        const ScopeOptions& options = {});

    [[nodiscard]] bool in_scope() const noexcept;

    // ============================================================
    // Views and conversion
    // ============================================================

    /// Cached view of a store node
    /// @throws AccessError(Deleted) for deleted nodes
    [[nodiscard]] MapView to_view(const SharedMapPtr& node);
    [[nodiscard]] ArrayView to_view(const SharedArrayPtr& node);
    [[nodiscard]] Data to_view(const StoreNode& node);

    /// Detached view over a plain map or sequence. Views are returned unchanged.
    /// @throws ConversionError(NotAContainer) for primitives
    /// @throws ConversionError(AlreadyStoreValue) for store nodes
    [[nodiscard]] Data to_detached_view(const Data& value, DetachedViewOptions options = {});

    /// Fresh, unparented store node built from a plain map or sequence
    /// @throws ConversionError(AlreadyView) / ConversionError(AlreadyStoreValue)
    [[nodiscard]] StoreNode to_store(const Data& value);

    /// Backing node of an attached view, nullopt for a detached one
    /// @throws AccessError(NotAView)
    [[nodiscard]] std::optional<StoreNode> unwrap(const Data& view) const;

    /// True when a and b are distinct views kept in sync with each other
    [[nodiscard]] bool are_aliased(const Data& a, const Data& b) const;

    /// Frozen snapshot of a view's current value
    /// @throws AccessError(NotAView)
    [[nodiscard]] Value to_json(const Data& view) const;

    [[nodiscard]] std::size_t live_view_count() const noexcept;
    [[nodiscard]] detail::AliasTracker::Stats alias_stats() const noexcept;

private:
    std::unique_ptr<detail::SessionImpl> impl_;
};

// ============================================================
// Raw values
// ============================================================

/// Deep-frozen copy that is stored and read back unconverted
[[nodiscard]] LIVE_TREE_API Value mark_raw(const Data& value);

/// True for frozen containers (mark_raw() results, raw data read back from the store)
[[nodiscard]] LIVE_TREE_API bool is_raw(const Data& value) noexcept;

[[nodiscard]] LIVE_TREE_API bool is_view(const Data& value) noexcept;

} // namespace live_tree
