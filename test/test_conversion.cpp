// test_conversion.cpp - Tests for converting written values into store content
// Primitives, raw data, store nodes, plain containers, cycles and aliases

#include "test_support.h"

using namespace live_tree;
using live_tree::testing::reason_is;

namespace {

SharedMapPtr backing_map(Session& session, const Data& view) {
    auto node = session.unwrap(view);
    REQUIRE(node.has_value());
    return std::get<SharedMapPtr>(*node);
}

} // anonymous namespace

// ============================================================
// Primitives and raw values
// ============================================================

TEST_CASE("Primitives are stored as frozen values", "[conversion][primitive]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views(root, [](MapView r) {
        r.set("null", nullptr);
        r.set("flag", true);
        r.set("int", 42);
        r.set("real", 1.5);
        r.set("text", "hello");
        r.set("blob", ByteBuffer{1, 2});

        REQUIRE(r.get("null").is_null());
        REQUIRE(r.get("flag") == Data{true});
        REQUIRE(r.get("int") == Data{42});
        REQUIRE(r.get("real") == Data{1.5});
        REQUIRE(r.get("text") == Data{"hello"});
        REQUIRE(r.get("blob") == Data{ByteBuffer{1, 2}});
    });

    REQUIRE(std::get<Value>(*root->get("int")).as_int() == 42);
    REQUIRE(std::get<Value>(*root->get("blob")).is_bytes());
}

TEST_CASE("Raw values pass through unconverted", "[conversion][raw]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    auto raw = mark_raw(Data::map({{"a", Data::array({1, 2})}}));
    REQUIRE(is_raw(raw));
    REQUIRE_FALSE(is_raw(Data{1}));
    REQUIRE_FALSE(is_raw(Data::map()));

    session.with_views(root, [&](MapView r) {
        r.set("frozen", raw);

        auto read = r.get("frozen");
        REQUIRE(is_raw(read));
        REQUIRE_FALSE(is_view(read));
        REQUIRE(*read.get_if<Value>() == raw);
    });

    // stored as a single frozen value, not as child nodes
    REQUIRE(std::holds_alternative<Value>(*root->get("frozen")));
}

TEST_CASE("Foreign objects are rejected before anything is written", "[conversion][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    root->set("keep", Value{1});
    const Data foreign{Foreign{std::make_shared<int>(7), "Date"}};

    SECTION("plain values") {
        session.with_views(root, [&](MapView r) {
            REQUIRE_THROWS_MATCHES(r.set("when", foreign), ConversionError,
                                   reason_is(ConversionFailure::UnsupportedType));
            REQUIRE_THROWS_MATCHES(r.set("keep", Data::map({{"when", foreign}})), ConversionError,
                                   reason_is(ConversionFailure::UnsupportedType));
            REQUIRE(r.get("keep") == Data{1});
            REQUIRE_FALSE(r.contains("when"));
        });
    }

    SECTION("a detached view written next to a foreign object stays detached") {
        auto list = doc.get_array("list");
        session.with_views(list, [&](ArrayView l) {
            auto detached = session.to_detached_view(Data::map({{"x", 1}}));
            REQUIRE_THROWS_MATCHES(l.push_back(Data::array({detached, foreign})), ConversionError,
                                   reason_is(ConversionFailure::UnsupportedType));
            REQUIRE_FALSE(detached.as_map().is_attached());
            REQUIRE_FALSE(session.unwrap(detached).has_value());
            REQUIRE(l.size() == 0);

            // the next successful write attaches it
            l.push_back(Data::array({detached}));
            REQUIRE(detached.as_map().is_attached());
            detached.as_map().set("x", 2);
            REQUIRE(list->to_plain() == Value::vector({Value::vector({Value::map({{"x", 2}})})}));
        });
    }

    SECTION("a failed write leaves detached and attached aliases alike") {
        auto gone = SharedMap::create();
        root->set("gone", gone);
        root->erase("gone");

        session.with_views(root, [&](MapView r) {
            auto item = Data::map({{"n", 1}});
            r.set("kept", item);
            r.set("removed", item);
            auto kept = r.get("kept").as_map();
            auto removed = r.get("removed").as_map();
            r.erase("removed");
            REQUIRE_FALSE(removed.is_attached());

            REQUIRE_THROWS_MATCHES(kept.set("n", gone), AccessError, reason_is(AccessFailure::Deleted));
            REQUIRE_THROWS_MATCHES(removed.set("n", foreign), ConversionError,
                                   reason_is(ConversionFailure::UnsupportedType));
            REQUIRE(kept.get("n") == Data{1});
            REQUIRE(removed.get("n") == Data{1});

            // the pair still moves together afterwards
            removed.set("n", 2);
            REQUIRE(kept.get("n") == Data{2});
        });
    }
}

// ============================================================
// Plain containers
// ============================================================

TEST_CASE("Plain containers become fresh store nodes", "[conversion][plain]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views(root, [](MapView r) {
        r.set("point", Data::map({{"x", 1}, {"tags", Data::array({"a", "b"})}}));

        auto point = r.get("point");
        REQUIRE(point.is_map_view());
        REQUIRE(point.as_map().get("tags").is_array_view());
        REQUIRE(point.as_map().get("tags").as_array().size() == 2);
    });

    auto point = std::get<SharedMapPtr>(*root->get("point"));
    REQUIRE(point->parent() == root.get());
    REQUIRE(root->to_plain() ==
            Value::map({{"point", Value::map({{"x", 1}, {"tags", Value::vector({"a", "b"})}})}}));
}

TEST_CASE("Cyclic plain containers are rejected", "[conversion][cycle][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    auto obj = Data::map({{"name", "loop"}});
    obj.as_plain_map()->insert_or_assign("self", obj);

    SECTION("through a view") {
        session.with_views(root, [&](MapView r) {
            REQUIRE_THROWS_MATCHES(r.set("obj", obj), ConversionError,
                                   reason_is(ConversionFailure::CyclicStructure));
            REQUIRE_FALSE(r.contains("obj"));
        });
    }

    SECTION("through to_store") {
        REQUIRE_THROWS_MATCHES(session.to_store(obj), ConversionError,
                               reason_is(ConversionFailure::CyclicStructure));
    }

    SECTION("indirect cycle") {
        auto list = Data::array({obj});
        obj.as_plain_map()->insert_or_assign("self", list);
        REQUIRE_THROWS_MATCHES(session.to_store(list), ConversionError,
                               reason_is(ConversionFailure::CyclicStructure));
    }

    SECTION("into a detached view") {
        auto detached = session.to_detached_view(Data::map()).as_map();
        REQUIRE_THROWS_MATCHES(detached.set("obj", obj), ConversionError,
                               reason_is(ConversionFailure::CyclicStructure));
        REQUIRE_FALSE(detached.contains("obj"));
    }

    SECTION("frozen as raw data") {
        REQUIRE_THROWS_MATCHES(mark_raw(obj), ConversionError, reason_is(ConversionFailure::CyclicStructure));
    }

    SECTION("shared but acyclic containers pass") {
        auto shared = Data::array({1});
        auto diamond = Data::map({{"a", shared}, {"b", shared}});
        REQUIRE(mark_raw(diamond) == Value::map({{"a", Value::vector({1})}, {"b", Value::vector({1})}}));
        REQUIRE(std::holds_alternative<SharedMapPtr>(session.to_store(diamond)));
    }

    obj.as_plain_map()->erase("self");
}

TEST_CASE("The same plain container written twice becomes aliases", "[conversion][alias]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto shared = Data::map({{"n", 1}});

    SECTION("in separate writes") {
        session.with_views(root, [&](MapView r) {
            r.set("a", shared);
            r.set("b", shared);

            auto a = r.get("a");
            auto b = r.get("b");
            REQUIRE_FALSE(a == b);
            REQUIRE(session.are_aliased(a, b));

            a.as_map().set("n", 2);
            REQUIRE(b.as_map().get("n") == Data{2});
        });

        REQUIRE(std::get<SharedMapPtr>(*root->get("b"))->to_plain() == Value::map({{"n", 2}}));
    }

    SECTION("within one write") {
        session.with_views(root, [&](MapView r) {
            r.set("pair", Data::array({shared, shared}));

            auto pair = r.get("pair").as_array();
            auto first = pair.at(0);
            auto second = pair.at(1);
            REQUIRE(session.are_aliased(first, second));

            second.as_map().set("m", "x");
            REQUIRE(first.as_map().get("m") == Data{"x"});
        });
    }

    // the source container is never written through
    REQUIRE(shared.as_plain_map()->size() == 1);
    REQUIRE(shared.as_plain_map()->at("n") == Data{1});
}

// ============================================================
// Store nodes and views
// ============================================================

TEST_CASE("Unparented store nodes are inserted as they are", "[conversion][node]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto node = SharedMap::create();
    node->set("a", Value{1});

    session.with_views(root, [&](MapView r) {
        r.set("node", node);
        REQUIRE(backing_map(session, r.get("node")) == node);
    });
    REQUIRE(node->parent() == root.get());
}

TEST_CASE("An unparented node used twice in one write is rejected", "[conversion][node][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto node = SharedMap::create();

    session.with_views(root, [&](MapView r) {
        REQUIRE_THROWS_MATCHES(r.set("pair", Data::array({node, node})), ConversionError,
                               reason_is(ConversionFailure::CannotCloneUnparented));
        REQUIRE_FALSE(r.contains("pair"));
        REQUIRE_FALSE(node->is_parented());
    });
}

TEST_CASE("Parented store nodes are cloned and aliased", "[conversion][node][alias]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto original = SharedMap::create();
    original->set("v", Value{1});
    root->set("original", original);

    session.with_views(root, [&](MapView r) {
        r.set("copy", original);

        auto copy_view = r.get("copy");
        auto original_view = r.get("original");
        REQUIRE(backing_map(session, copy_view) != original);
        REQUIRE(session.are_aliased(copy_view, original_view));

        copy_view.as_map().set("v", 2);
        REQUIRE(original_view.as_map().get("v") == Data{2});
    });

    REQUIRE(std::get<Value>(*original->get("v")).as_int() == 2);
}

TEST_CASE("Writing an attached view clones its node", "[conversion][view]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views(root, [&](MapView r) {
        r.set("a", Data::map({{"x", 1}}));
        r.set("b", r.get("a"));

        auto a = r.get("a").as_map();
        auto b = r.get("b").as_map();
        REQUIRE_FALSE(a == b);
        REQUIRE(a.is_attached());
        REQUIRE(b.is_attached());
        REQUIRE(session.are_aliased(a, b));

        b.erase("x");
        REQUIRE_FALSE(a.contains("x"));
    });
}

TEST_CASE("Deleted store nodes cannot be written", "[conversion][node][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto child = SharedMap::create();
    root->set("child", child);
    root->erase("child");

    session.with_views(root, [&](MapView r) {
        REQUIRE_THROWS_MATCHES(r.set("child", child), AccessError, reason_is(AccessFailure::Deleted));
    });
}

// ============================================================
// Session::to_store
// ============================================================

TEST_CASE("to_store builds unparented nodes from plain values", "[conversion][to_store]") {
    Doc doc;
    Session session;

    auto node = session.to_store(Data::array({1, Data::map({{"k", "v"}})}));
    auto array = std::get<SharedArrayPtr>(node);
    REQUIRE_FALSE(array->is_parented());
    REQUIRE(array->to_plain() == Value::vector({1, Value::map({{"k", "v"}})}));

    auto root = doc.get_map("root");
    root->set("list", array);
    REQUIRE(array->doc() == &doc);
}

TEST_CASE("to_store rejects non-plain input", "[conversion][to_store][errors]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    REQUIRE_THROWS_MATCHES(session.to_store(Data{1}), ConversionError,
                           reason_is(ConversionFailure::NotAContainer));
    REQUIRE_THROWS_MATCHES(session.to_store(root), ConversionError,
                           reason_is(ConversionFailure::AlreadyStoreValue));

    session.with_views(root, [&](MapView r) {
        REQUIRE_THROWS_MATCHES(session.to_store(r), ConversionError,
                               reason_is(ConversionFailure::AlreadyView));
    });
}
