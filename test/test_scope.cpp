// test_scope.cpp - Tests for view scopes
// Auto, manual and async modes, origins, invalidation and revocation

#include "test_support.h"

#include <string_view>

using namespace live_tree;
using live_tree::testing::reason_is;

namespace {

/// Records the origin of every transaction that touches root
struct OriginRecorder {
    std::vector<std::optional<Origin>> origins;
    ScopedConnection conn;

    explicit OriginRecorder(const SharedTypePtr& root)
        : conn(root->observe_deep([this](const std::vector<ChangeEvent>&, const Transaction& txn) {
              origins.push_back(txn.origin);
          })) {}
};

bool is_generated(const std::optional<Origin>& origin) {
    constexpr std::string_view prefix = LIVE_TREE_SCOPE_ORIGIN_PREFIX;
    return origin && origin->compare(0, prefix.size(), prefix) == 0 && origin->size() > prefix.size();
}

} // anonymous namespace

// ============================================================
// Auto mode
// ============================================================

TEST_CASE("Auto scopes run the body in one transaction", "[scope][auto]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    OriginRecorder recorder(root);
    const auto before = doc.stats().transactions;

    session.with_views(root, [&](MapView r) {
        REQUIRE(session.in_scope());
        r.set("a", 1);
        r.set("b", Data::map({{"c", 2}}));
        r.get("b").as_map().set("c", 3);
        r.erase("a");
        REQUIRE(doc.in_transaction());
    }, {.origin = "editor"});

    REQUIRE_FALSE(session.in_scope());
    REQUIRE(doc.stats().transactions == before + 1);
    REQUIRE(recorder.origins == std::vector<std::optional<Origin>>{Origin{"editor"}});
    REQUIRE(root->to_plain() == Value::map({{"b", Value::map({{"c", 3}})}}));
}

TEST_CASE("Scopes without an origin get a generated one", "[scope][origin]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    OriginRecorder recorder(root);

    session.with_views(root, [](MapView r) { r.set("n", 1); });
    session.with_views(root, [](MapView r) { r.set("n", 2); });

    REQUIRE(recorder.origins.size() == 2);
    REQUIRE(is_generated(recorder.origins[0]));
    REQUIRE(is_generated(recorder.origins[1]));
    REQUIRE(recorder.origins[0] != recorder.origins[1]);
}

TEST_CASE("Scopes do not nest", "[scope][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto list = doc.get_array("list");

    session.with_views(root, [&](MapView r) {
        REQUIRE_THROWS_MATCHES(session.with_views(list, [](ArrayView) {}), ScopeError,
                               reason_is(ScopeFailure::NestedScope));
        // the outer scope is unaffected
        r.set("still", true);
        REQUIRE(session.in_scope());
    });

    REQUIRE(root->to_plain() == Value::map({{"still", true}}));

    // and a new scope can be opened afterwards
    session.with_views(list, [](ArrayView l) { l.push_back(1); });
    REQUIRE(list->size() == 1);
}

TEST_CASE("One scope can cover several roots", "[scope][auto]") {
    Doc doc;
    Doc other;
    Session session;
    auto root = doc.get_map("root");
    auto list = other.get_array("list");
    OriginRecorder root_recorder(root);
    OriginRecorder list_recorder(list);

    session.with_views({root, list}, [](const Session::RootViews& views) {
        REQUIRE(views.size() == 2);
        views[0].as_map().set("k", "v");
        views[1].as_array().push_back(7);
    }, {.origin = "sync"});

    REQUIRE(root_recorder.origins == std::vector<std::optional<Origin>>{Origin{"sync"}});
    REQUIRE(list_recorder.origins == std::vector<std::optional<Origin>>{Origin{"sync"}});
    REQUIRE(doc.stats().transactions == 1);
    REQUIRE(other.stats().transactions == 1);
}

TEST_CASE("Scopes reject unusable roots", "[scope][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();
    root->set("child", child);
    root->erase("child");

    REQUIRE_THROWS_MATCHES(session.with_views(child, [](MapView) {}), AccessError,
                           reason_is(AccessFailure::Deleted));
    REQUIRE_THROWS_AS(session.with_views(SharedMapPtr{}, [](MapView) {}), std::invalid_argument);
    REQUIRE_FALSE(session.in_scope());
}

// ============================================================
// Closing
// ============================================================

TEST_CASE("Closing a scope revokes the views it produced", "[scope][revoke]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    root->set("child", SharedMap::create());

    // a view created outside any scope is not owned by the next one
    auto outside = session.to_view(std::get<SharedMapPtr>(*root->get("child")));
    const auto baseline = session.live_view_count();

    Data inside;
    session.with_views(root, [&](MapView r) {
        r.set("list", Data::array({Data::map()}));
        inside = r.get("list");
        REQUIRE(r.get("child") == Data{outside});
        REQUIRE(session.live_view_count() > baseline);
    });

    REQUIRE(session.live_view_count() == baseline);
    REQUIRE_THROWS_MATCHES(inside.as_array().size(), AccessError, reason_is(AccessFailure::Revoked));
    REQUIRE(outside.valid());
    outside.set("ok", 1);
    REQUIRE(std::get<SharedMapPtr>(*root->get("child"))->contains("ok"));
}

TEST_CASE("A failing body still closes the scope", "[scope][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    MapView captured;
    REQUIRE_THROWS_WITH(session.with_views(root, [&](MapView r) {
        captured = r;
        r.set("written", 1);
        throw std::runtime_error("boom");
    }), "boom");

    REQUIRE_FALSE(session.in_scope());
    REQUIRE_FALSE(captured.valid());
    // without rollback the write stays
    REQUIRE(root->contains("written"));
}

// ============================================================
// Manual mode
// ============================================================

TEST_CASE("Manual scopes batch through the context", "[scope][manual]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    OriginRecorder recorder(root);

    session.with_views_manual(root, [&](MapView r, const ManualContext& ctx) {
        REQUIRE(ctx.origin() == "manual");
        REQUIRE_FALSE(doc.in_transaction());

        ctx.transact([&] {
            r.set("a", 1);
            r.set("b", 2);
        });
        REQUIRE(doc.stats().transactions == 1);

        // a write outside transact is its own transaction, still tagged
        r.set("c", 3);
        REQUIRE(doc.stats().transactions == 2);
        REQUIRE_FALSE(ctx.is_invalidated());
    }, {.origin = "manual"});

    REQUIRE(recorder.origins == std::vector<std::optional<Origin>>{Origin{"manual"}, Origin{"manual"}});
    REQUIRE(root->to_plain() == Value::map({{"a", 1}, {"b", 2}, {"c", 3}}));
}

TEST_CASE("Foreign changes invalidate a manual scope", "[scope][manual][invalidate]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views_manual(root, [&](MapView r, const ManualContext& ctx) {
        r.set("child", Data::map());
        auto child = r.get("child").as_map();

        SECTION("change from another origin") {
            doc.transact([&] { root->set("remote", Value{1}); }, "remote");
        }

        SECTION("change without an origin") {
            root->set("remote", Value{1});
        }

        SECTION("change below a root") {
            std::get<SharedMapPtr>(*root->get("child"))->set("remote", Value{1});
        }

        REQUIRE(ctx.is_invalidated());
        REQUIRE_FALSE(r.valid());
        REQUIRE_FALSE(child.valid());
        REQUIRE_THROWS_MATCHES(r.get("remote"), AccessError, reason_is(AccessFailure::Revoked));
        REQUIRE_THROWS_MATCHES(ctx.transact([] {}), ScopeError, reason_is(ScopeFailure::Invalidated));
        REQUIRE(session.in_scope());
    });

    REQUIRE_FALSE(session.in_scope());
}

TEST_CASE("Changes tagged with the scope origin keep a manual scope valid", "[scope][manual][invalidate]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views_manual(root, [&](MapView r, const ManualContext& ctx) {
        doc.transact([&] { root->set("same", Value{1}); }, ctx.origin());
        REQUIRE_FALSE(ctx.is_invalidated());
        REQUIRE(r.get("same") == Data{1});
    });
}

TEST_CASE("A context outlives its scope only as closed", "[scope][manual][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    std::optional<ManualContext> saved;
    session.with_views_manual(root, [&](MapView, const ManualContext& ctx) { saved = ctx; });

    REQUIRE(saved.has_value());
    REQUIRE_THROWS_MATCHES(saved->transact([] {}), ScopeError, reason_is(ScopeFailure::Closed));
    REQUIRE_FALSE(saved->is_invalidated());
}

// ============================================================
// Async mode
// ============================================================

TEST_CASE("Async scopes stay open until the future is waited on", "[scope][async]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    auto done = session.with_views_async(root, [](MapView r, ManualContext ctx) {
        return std::async(std::launch::deferred, [r, ctx] {
            ctx.transact([&] { r.set("late", 1); });
        });
    }, {.origin = "worker"});

    REQUIRE(session.in_scope());
    REQUIRE_FALSE(root->contains("late"));

    done.get();
    REQUIRE_FALSE(session.in_scope());
    REQUIRE(root->to_plain() == Value::map({{"late", 1}}));
}

TEST_CASE("Dropping an async scope future closes the scope", "[scope][async]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    MapView captured;
    {
        auto done = session.with_views_async(root, [&](MapView r, ManualContext) {
            captured = r;
            return std::future<void>{};
        });
        REQUIRE(session.in_scope());
    }
    REQUIRE_FALSE(session.in_scope());
    REQUIRE_FALSE(captured.valid());
}

TEST_CASE("Async scopes are invalidated while suspended", "[scope][async][invalidate]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    auto done = session.with_views_async(root, [](MapView r, ManualContext ctx) {
        return std::async(std::launch::deferred, [r, ctx] {
            ctx.transact([&] { r.set("late", 1); });
        });
    });

    root->set("remote", Value{true});
    REQUIRE_THROWS_MATCHES(done.get(), ScopeError, reason_is(ScopeFailure::Invalidated));
    REQUIRE_FALSE(root->contains("late"));
    REQUIRE_FALSE(session.in_scope());
}

TEST_CASE("Async scope errors propagate and roll back", "[scope][async][rollback]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    root->set("n", Value{1});

    auto done = session.with_views_async(root, [](MapView r, ManualContext) {
        r.set("n", 2);
        return std::async(std::launch::deferred, [r] {
            r.set("n", 3);
            throw std::runtime_error("failed later");
        });
    }, {.rollback_on_error = true});

    REQUIRE_THROWS_WITH(done.get(), "failed later");
    REQUIRE(root->to_plain() == Value::map({{"n", 1}}));
    REQUIRE_FALSE(session.in_scope());
}

TEST_CASE("Errors thrown before the async body suspends close the scope", "[scope][async][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    auto start = [&] {
        return session.with_views_async(root, [](MapView, ManualContext) -> std::future<void> {
            throw std::logic_error("not started");
        });
    };
    REQUIRE_THROWS_AS(start(), std::logic_error);
    REQUIRE_FALSE(session.in_scope());
}
