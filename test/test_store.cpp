// test_store.cpp - Tests for the in-process document store
// Roots, single parenting, deletion, transactions and deep observers

#include "test_support.h"

#include <stdexcept>

using namespace live_tree;

// ============================================================
// Roots and nodes
// ============================================================

TEST_CASE("Doc roots are created once", "[store][doc]") {
    Doc doc;
    auto root = doc.get_map("root");
    auto list = doc.get_array("list");

    REQUIRE(doc.get_map("root") == root);
    REQUIRE(root->doc() == &doc);
    REQUIRE(root->parent() == nullptr);
    REQUIRE(root->is_parented());
    REQUIRE(list->kind() == NodeKind::Array);

    REQUIRE_THROWS_AS(doc.get_array("root"), std::logic_error);
    REQUIRE_THROWS_AS(doc.get_map("list"), std::logic_error);
}

TEST_CASE("SharedMap basic operations", "[store][map]") {
    Doc doc;
    auto root = doc.get_map("root");

    root->set("b", Value{2});
    root->set("a", Value{"one"});

    REQUIRE(root->size() == 2);
    REQUIRE(root->contains("a"));
    REQUIRE(root->keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(std::get<Value>(*root->get("b")).as_int() == 2);
    REQUIRE_FALSE(root->get("missing").has_value());
    REQUIRE(root->find("missing") == nullptr);

    REQUIRE(root->erase("a"));
    REQUIRE_FALSE(root->erase("a"));
    REQUIRE(root->to_plain() == Value::map({{"b", 2}}));

    root->clear();
    REQUIRE(root->size() == 0);
}

TEST_CASE("SharedArray basic operations", "[store][array]") {
    Doc doc;
    auto list = doc.get_array("list");

    list->push_back(Value{1});
    list->insert(1, {Value{2}, Value{3}});
    list->insert(0, {Value{0}});

    REQUIRE(list->size() == 4);
    REQUIRE(testing::ints(list->to_plain()) == std::vector<int64_t>{0, 1, 2, 3});

    list->erase(1, 2);
    REQUIRE(testing::ints(list->to_plain()) == std::vector<int64_t>{0, 3});
    REQUIRE(list->slice(0, 10).size() == 2);
    REQUIRE_FALSE(list->get(5).has_value());

    REQUIRE_THROWS_AS(list->at(2), std::out_of_range);
    REQUIRE_THROWS_AS(list->insert(3, {Value{9}}), std::out_of_range);
    REQUIRE_THROWS_AS(list->erase(1, 2), std::out_of_range);
}

// ============================================================
// Parenting and deletion
// ============================================================

TEST_CASE("Store nodes have a single parent", "[store][parent]") {
    Doc doc;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();

    REQUIRE_FALSE(child->is_parented());
    REQUIRE(child->doc() == nullptr);

    root->set("child", child);
    REQUIRE(child->is_parented());
    REQUIRE(child->doc() == &doc);
    REQUIRE(child->parent() == root.get());

    SECTION("inserting a parented node throws") {
        REQUIRE_THROWS_AS(root->set("again", child), std::invalid_argument);
        auto list = doc.get_array("list");
        REQUIRE_THROWS_AS(list->push_back(child), std::invalid_argument);
    }

    SECTION("the same node twice in one insert throws") {
        auto list = doc.get_array("list");
        auto item = SharedArray::create();
        REQUIRE_THROWS_AS(list->insert(0, {item, item}), std::invalid_argument);
        REQUIRE(list->size() == 0);
    }

    SECTION("a node cannot contain its ancestor") {
        auto outer = SharedMap::create();
        auto inner = SharedMap::create();
        outer->set("inner", inner);
        REQUIRE_THROWS_AS(inner->set("outer", outer), std::invalid_argument);
    }
}

TEST_CASE("Removing a node deletes its subtree", "[store][delete]") {
    Doc doc;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();
    auto grandchild = SharedArray::create();
    child->set("items", grandchild);
    root->set("child", child);

    REQUIRE(grandchild->doc() == &doc);

    SECTION("erase") {
        root->erase("child");
    }

    SECTION("overwrite") {
        root->set("child", Value{1});
    }

    REQUIRE(child->is_deleted());
    REQUIRE(grandchild->is_deleted());
    REQUIRE(child->doc() == nullptr);

    // deleted nodes stay unusable
    REQUIRE(child->is_parented());
    REQUIRE_THROWS_AS(child->set("x", Value{1}), std::logic_error);
    REQUIRE_THROWS_AS(root->set("back", child), std::invalid_argument);
}

TEST_CASE("Destroying the document deletes every node", "[store][delete]") {
    auto child = SharedMap::create();
    SharedMapPtr root;
    {
        Doc doc;
        root = doc.get_map("root");
        root->set("child", child);
        doc.destroy();
        REQUIRE(doc.is_destroyed());
        REQUIRE(root->is_deleted());
        REQUIRE(child->is_deleted());
    }
    REQUIRE(root->is_deleted());
}

TEST_CASE("clone copies a subtree with fresh ids", "[store][clone]") {
    Doc doc;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();
    child->set("list", SharedArray::create());
    root->set("child", child);

    auto copy = child->clone();
    REQUIRE(copy->id() != child->id());
    REQUIRE_FALSE(copy->is_parented());
    REQUIRE(copy->to_plain() == child->to_plain());

    auto inner = std::get<SharedArrayPtr>(*copy->get("list"));
    REQUIRE(inner->parent() == copy.get());
    REQUIRE(inner != std::get<SharedArrayPtr>(*child->get("list")));
}

// ============================================================
// Transactions and observers
// ============================================================

TEST_CASE("Transactions carry their origin to observers", "[store][transaction]") {
    Doc doc;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();
    root->set("child", child);

    std::vector<std::optional<Origin>> origins;
    std::size_t events = 0;
    ScopedConnection conn = root->observe_deep([&](const std::vector<ChangeEvent>& changes, const Transaction& txn) {
        origins.push_back(txn.origin);
        events += changes.size();
    });

    doc.transact([&] {
        child->set("a", Value{1});
        root->set("b", Value{2});
        REQUIRE(origins.empty());
    }, "editor");

    REQUIRE(origins.size() == 1);
    REQUIRE(origins.front() == Origin{"editor"});
    REQUIRE(events == 2);

    child->set("c", Value{3});
    REQUIRE(origins.size() == 2);
    REQUIRE_FALSE(origins.back().has_value());

    conn.reset();
    child->set("d", Value{4});
    REQUIRE(origins.size() == 2);
}

TEST_CASE("Nested transactions join the outer one", "[store][transaction]") {
    Doc doc;
    auto root = doc.get_map("root");
    const auto before = doc.stats().transactions;

    std::optional<Origin> seen;
    auto conn = doc.on_after_transaction([&](const Transaction& txn) { seen = txn.origin; });

    doc.transact([&] {
        root->set("a", Value{1});
        doc.transact([&] { root->set("b", Value{2}); }, "inner");
        REQUIRE(doc.in_transaction());
    }, "outer");

    REQUIRE(doc.stats().transactions == before + 1);
    REQUIRE(doc.stats().changes >= 2);
    REQUIRE(seen == Origin{"outer"});
    REQUIRE_FALSE(doc.in_transaction());
    conn.disconnect();
}

TEST_CASE("Changes before an exception are committed", "[store][transaction]") {
    Doc doc;
    auto root = doc.get_map("root");

    REQUIRE_THROWS_AS(doc.transact([&] {
        root->set("a", Value{1});
        throw std::runtime_error("boom");
    }), std::runtime_error);

    REQUIRE(root->contains("a"));
    REQUIRE_FALSE(doc.in_transaction());
}

TEST_CASE("Mutations of unparented nodes run outside any document", "[store][transaction]") {
    Doc doc;
    auto node = SharedMap::create();
    node->set("a", Value{1});
    REQUIRE(doc.stats().transactions == 0);

    auto root = doc.get_map("root");
    root->set("node", node);
    REQUIRE(doc.stats().transactions == 1);
    REQUIRE(root->to_plain() == Value::map({{"node", Value::map({{"a", 1}})}}));
}
