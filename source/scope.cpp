// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file scope.cpp
/// @brief Scope lifecycle: open, run, invalidate, roll back, close

#include "session_impl.h"

#include <atomic>

namespace live_tree {
namespace detail {

namespace {

Origin generate_origin() {
    static std::atomic<std::uint64_t> counter{0};
    return LIVE_TREE_SCOPE_ORIGIN_PREFIX + std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
}

} // anonymous namespace

// ============================================================
// ScopeState
// ============================================================

void ScopeState::revoke_produced() noexcept {
    auto views = std::exchange(produced, {});
    if (!session) return;
    for (auto [slot, generation] : views) {
        session->revoke(slot, generation);
    }
}

void ScopeState::invalidate() noexcept {
    if (invalidated || closed) return;
    invalidated = true;
    log_scope_event(origin, "invalidated by a change from another origin");
    if (rollback) rollback->invalidate();
    revoke_produced();
}

void ScopeState::rollback_if_needed() noexcept {
    if (!rollback || invalidated || closed || !session || !rollback->can_rollback()) return;
    if (rollback->size() == 0) return;

    log_scope_event(origin, "rolling back after an error");
    try {
        session->transact_all(docs, [this] { rollback->execute(); }, origin);
    } catch (const std::exception& e) {
        log_scope_event(origin, e.what());
    }
}

void ScopeState::close() noexcept {
    if (closed) return;
    closed = true;
    revoke_produced();
    watchers.clear();
    if (session && session->scope == this) session->scope = nullptr;
}

void ScopeState::abandon() noexcept {
    closed = true;
    produced.clear();
    watchers.clear();
    session = nullptr;
}

// ============================================================
// SessionImpl scope support
// ============================================================

std::optional<Origin> SessionImpl::current_origin() const {
    if (scope) return scope->origin;
    return std::nullopt;
}

bool SessionImpl::can_log_inverse() const noexcept {
    return scope && !scope->invalidated && scope->rollback && scope->rollback->can_rollback();
}

void SessionImpl::log_inverse(RollbackLog::InverseOp op) {
    if (can_log_inverse()) scope->rollback->log(std::move(op));
}

void SessionImpl::transact_all(const std::vector<Doc*>& docs, const std::function<void()>& fn,
                               const std::optional<Origin>& origin) {
    std::function<void(std::size_t)> step = [&](std::size_t index) {
        if (index == docs.size()) {
            fn();
            return;
        }
        docs[index]->transact([&] { step(index + 1); }, origin);
    };
    step(0);
}

std::shared_ptr<ScopeState> SessionImpl::open_scope(const std::vector<StoreNode>& roots, ScopeMode mode,
                                                    const ScopeOptions& options, RootViews& views) {
    if (scope) {
        log_scope_event(scope->origin, "rejected a nested scope");
        throw ScopeError(ScopeFailure::NestedScope,
                         "a scope is already open on this session; pass every root to one call");
    }

    auto state = std::make_shared<ScopeState>();
    state->session = this;
    state->mode = mode;
    state->origin = options.origin.value_or(generate_origin());
    if (options.rollback_on_error) state->rollback.emplace();

    std::vector<SharedTypePtr> nodes;
    for (const auto& root : roots) {
        auto node = store_node_ptr(root);
        if (!node) throw std::invalid_argument("with_views: null root");
        if (node->is_deleted()) {
            throw AccessError(AccessFailure::Deleted, "with_views: root has been deleted");
        }
        if (auto* doc = node->doc(); doc && std::find(state->docs.begin(), state->docs.end(), doc) == state->docs.end()) {
            state->docs.push_back(doc);
        }
        nodes.push_back(std::move(node));
    }

    scope = state.get();
    ScopeCloser closer(state);
    for (const auto& node : nodes) {
        views.push_back(view_of(node));
    }
    if (mode == ScopeMode::Manual) {
        std::weak_ptr<ScopeState> weak = state;
        for (const auto& node : nodes) {
            state->watchers.add(node->observe_deep([weak](const std::vector<ChangeEvent>&, const Transaction& txn) {
                auto current = weak.lock();
                if (!current || current->closed || current->invalidated) return;
                if (txn.origin != current->origin) current->invalidate();
            }));
        }
    }
    closer.state.reset();
    return state;
}

void SessionImpl::run_auto(const std::vector<StoreNode>& roots, const ScopeOptions& options,
                           const std::function<void(const RootViews&)>& body) {
    RootViews views;
    auto state = open_scope(roots, ScopeMode::Auto, options, views);
    ScopeCloser closer(state);

    transact_all(state->docs, [&] {
        try {
            body(views);
        } catch (...) {
            state->rollback_if_needed();
            throw;
        }
    }, state->origin);
}

void SessionImpl::run_manual(const std::vector<StoreNode>& roots, const ScopeOptions& options,
                             const std::function<void(const RootViews&, const ManualContext&)>& body) {
    RootViews views;
    auto state = open_scope(roots, ScopeMode::Manual, options, views);
    ScopeCloser closer(state);

    const ManualContext context(state);
    try {
        body(views, context);
    } catch (...) {
        state->rollback_if_needed();
        throw;
    }
}

std::future<void> SessionImpl::run_async(
    const std::vector<StoreNode>& roots, const ScopeOptions& options,
    const std::function<std::future<void>(const RootViews&, ManualContext)>& body) {
    RootViews views;
    auto state = open_scope(roots, ScopeMode::Manual, options, views);
    auto closer = std::make_shared<ScopeCloser>(state);

    std::future<void> pending;
    try {
        pending = body(views, ManualContext(state));
    } catch (...) {
        state->rollback_if_needed();
        throw;
    }

    return std::async(std::launch::deferred, [state, closer, pending = std::move(pending)]() mutable {
        try {
            if (pending.valid()) pending.get();
        } catch (...) {
            state->rollback_if_needed();
            closer.reset();
            throw;
        }
        closer.reset();
    });
}

} // namespace detail

// ============================================================
// ManualContext
// ============================================================

void ManualContext::transact(const std::function<void()>& fn) const {
    auto state = state_.lock();
    if (!state || state->closed || !state->session) {
        throw ScopeError(ScopeFailure::Closed, "transact: the scope has been closed");
    }
    if (state->invalidated) {
        throw ScopeError(ScopeFailure::Invalidated,
                         "transact: the scope was invalidated by a change from another origin");
    }
    state->session->transact_all(state->docs, fn, state->origin);
}

bool ManualContext::is_invalidated() const noexcept {
    auto state = state_.lock();
    return state && state->invalidated;
}

Origin ManualContext::origin() const {
    if (auto state = state_.lock()) return state->origin;
    return {};
}

// ============================================================
// Session scope entry points
// ============================================================

void Session::with_views(const SharedMapPtr& root, const std::function<void(MapView)>& body,
                         const ScopeOptions& options) {
    impl_->run_auto({root}, options, [&](const RootViews& views) { body(views.front().as_map()); });
}

void Session::with_views(const SharedArrayPtr& root, const std::function<void(ArrayView)>& body,
                         const ScopeOptions& options) {
    impl_->run_auto({root}, options, [&](const RootViews& views) { body(views.front().as_array()); });
}

void Session::with_views(const std::vector<StoreNode>& roots, const std::function<void(const RootViews&)>& body,
                         const ScopeOptions& options) {
    impl_->run_auto(roots, options, body);
}

void Session::with_views_manual(const SharedMapPtr& root,
                                const std::function<void(MapView, const ManualContext&)>& body,
                                const ScopeOptions& options) {
    impl_->run_manual({root}, options, [&](const RootViews& views, const ManualContext& ctx) {
        body(views.front().as_map(), ctx);
    });
}

void Session::with_views_manual(const SharedArrayPtr& root,
                                const std::function<void(ArrayView, const ManualContext&)>& body,
                                const ScopeOptions& options) {
    impl_->run_manual({root}, options, [&](const RootViews& views, const ManualContext& ctx) {
        body(views.front().as_array(), ctx);
    });
}

void Session::with_views_manual(const std::vector<StoreNode>& roots,
                                const std::function<void(const RootViews&, const ManualContext&)>& body,
                                const ScopeOptions& options) {
    impl_->run_manual(roots, options, body);
}

std::future<void> Session::with_views_async(const SharedMapPtr& root,
                                            const std::function<std::future<void>(MapView, ManualContext)>& body,
                                            const ScopeOptions& options) {
    return impl_->run_async({root}, options, [&](const RootViews& views, ManualContext ctx) {
        return body(views.front().as_map(), std::move(ctx));
    });
}

std::future<void> Session::with_views_async(const SharedArrayPtr& root,
                                            const std::function<std::future<void>(ArrayView, ManualContext)>& body,
                                            const ScopeOptions& options) {
    return impl_->run_async({root}, options, [&](const RootViews& views, ManualContext ctx) {
        return body(views.front().as_array(), std::move(ctx));
    });
}

std::future<void> Session::with_views_async(
    const std::vector<StoreNode>& roots,
    const std::function<std::future<void>(const RootViews&, ManualContext)>& body,
    const ScopeOptions& options) {
    return impl_->run_async(roots, options, body);
}

} // namespace live_tree
