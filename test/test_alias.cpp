// test_alias.cpp - Tests for alias groups and write fan-out across aliases

#include "test_support.h"

using namespace live_tree;

// ============================================================
// AliasGroups
// ============================================================

TEST_CASE("AliasGroups link, merge and collapse", "[alias][groups]") {
    detail::AliasGroups<int> groups;

    SECTION("linking creates a two member group") {
        groups.link(1, 2);
        REQUIRE(groups.same_group(1, 2));
        REQUIRE(groups.siblings(1) == std::vector<int>{2});
        REQUIRE(groups.member_count() == 2);
    }

    SECTION("self links are ignored") {
        groups.link(1, 1);
        REQUIRE(groups.member_count() == 0);
        REQUIRE(groups.siblings(1).empty());
    }

    SECTION("groups merge") {
        groups.link(1, 2);
        groups.link(3, 4);
        groups.link(2, 3);
        REQUIRE(groups.same_group(1, 4));
        REQUIRE(groups.siblings(4).size() == 3);

        groups.link(5, 1);
        REQUIRE(groups.siblings(5).size() == 4);
    }

    SECTION("a group that would shrink to one member is dropped") {
        groups.link(1, 2);
        groups.link(2, 3);

        REQUIRE_FALSE(groups.remove(3).has_value());
        REQUIRE(groups.same_group(1, 2));

        auto orphan = groups.remove(1);
        REQUIRE(orphan == std::optional<int>{2});
        REQUIRE_FALSE(groups.same_group(1, 2));
        REQUIRE(groups.member_count() == 0);
        REQUIRE_FALSE(groups.remove(7).has_value());
    }
}

// ============================================================
// AliasTracker
// ============================================================

TEST_CASE("Node siblings are filtered to live nodes of the same document", "[alias][tracker]") {
    Doc doc;
    Doc other_doc;
    auto root = doc.get_map("root");
    auto a = SharedMap::create();
    auto b = SharedMap::create();
    auto c = SharedMap::create();
    root->set("a", a);
    root->set("b", b);
    other_doc.get_map("root")->set("c", c);

    detail::AliasTracker tracker;
    tracker.link_nodes(a, b);
    tracker.link_nodes(b, c);

    REQUIRE(tracker.node_siblings(*a) == std::vector<SharedTypePtr>{b});
    REQUIRE(tracker.stats().aliased_nodes == 3);

    root->erase("b");
    REQUIRE(tracker.node_siblings(*a).empty());

    tracker.unlink_node(b->id());
    tracker.unlink_node(c->id());
    REQUIRE(tracker.stats().aliased_nodes == 0);
}

TEST_CASE("Expired nodes leave their group", "[alias][tracker]") {
    detail::AliasTracker tracker;
    auto keep = SharedArray::create();
    {
        auto gone = SharedArray::create();
        tracker.link_nodes(keep, gone);
        REQUIRE(tracker.stats().aliased_nodes == 2);
    }
    REQUIRE(tracker.node_siblings(*keep).empty());
    REQUIRE(tracker.stats().aliased_nodes == 0);
}

TEST_CASE("View groups", "[alias][tracker]") {
    detail::AliasTracker tracker;
    tracker.link_views(0, 1);
    tracker.link_views(1, 2);

    REQUIRE(tracker.views_linked(0, 2));
    REQUIRE_FALSE(tracker.views_linked(0, 0));
    REQUIRE(tracker.view_siblings(2).size() == 2);

    tracker.unlink_view(1);
    REQUIRE(tracker.views_linked(0, 2));
    tracker.unlink_view(0);
    REQUIRE(tracker.stats().aliased_views == 0);
}

// ============================================================
// Fan-out through views
// ============================================================

TEST_CASE("Writes through one alias reach every alias in one transaction", "[alias][fanout]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto r = session.to_view(root);

    auto item = Data::map({{"count", 0}});
    r.set("first", item);
    r.set("second", item);
    r.set("third", r.get("first"));

    auto first = r.get("first").as_map();
    auto second = r.get("second").as_map();
    auto third = r.get("third").as_map();
    REQUIRE(session.are_aliased(first, second));
    REQUIRE(session.are_aliased(second, third));
    REQUIRE_FALSE(session.are_aliased(first, first));
    REQUIRE(session.alias_stats().aliased_nodes == 3);

    const auto before = doc.stats().transactions;
    third.set("count", 5);
    REQUIRE(doc.stats().transactions == before + 1);

    for (const auto& key : {"first", "second", "third"}) {
        REQUIRE(std::get<SharedMapPtr>(*root->get(key))->to_plain() == Value::map({{"count", 5}}));
    }

    second.erase("count");
    REQUIRE_FALSE(first.contains("count"));
    REQUIRE_FALSE(third.contains("count"));
}

TEST_CASE("Sequence aliases mirror every sequence operation", "[alias][fanout]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto r = session.to_view(root);

    auto items = Data::array({3, 1, 2});
    r.set("a", items);
    r.set("b", items);
    auto a = r.get("a").as_array();
    auto b = r.get("b").as_array();

    a.push_back(4);
    b.sort();
    a.splice(0, 1, {0});
    b.reverse();
    a.set(5, 9);

    REQUIRE(a.to_json() == b.to_json());
    REQUIRE(testing::ints(b) == std::vector<int64_t>{4, 3, 2, 0, -1, 9});
}

TEST_CASE("Containers written through one alias stay aliased below it", "[alias][fanout]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");
    auto r = session.to_view(root);

    auto item = Data::map();
    r.set("a", item);
    r.set("b", item);
    auto a = r.get("a").as_map();
    auto b = r.get("b").as_map();

    a.set("point", Data::map({{"tags", Data::array({"x"})}}));
    REQUIRE(b.get("point").as_map().get("tags").as_array().size() == 1);
    REQUIRE(session.are_aliased(a.get("point"), b.get("point")));

    b.get("point").as_map().get("tags").as_array().push_back("y");
    REQUIRE(a.get("point").as_map().get("tags").as_array().size() == 2);
    REQUIRE(a.to_json() == b.to_json());
}

TEST_CASE("Unrelated values are not aliases", "[alias][fanout]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views(root, [&](MapView r) {
        r.set("a", Data::map({{"x", 1}}));
        r.set("b", Data::map({{"x", 1}}));

        auto a = r.get("a");
        auto b = r.get("b");
        REQUIRE_FALSE(session.are_aliased(a, b));
        REQUIRE_FALSE(session.are_aliased(a, Data{1}));

        a.as_map().set("x", 2);
        REQUIRE(b.as_map().get("x") == Data{1});
    });
}

TEST_CASE("Aliases survive the removal of one member", "[alias][detach]") {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    session.with_views(root, [&](MapView r) {
        auto item = Data::map({{"n", 1}});
        r.set("kept", item);
        r.set("removed", item);
        auto kept = r.get("kept").as_map();
        auto removed = r.get("removed").as_map();

        r.erase("removed");
        REQUIRE_FALSE(removed.is_attached());
        REQUIRE(removed.get("n") == Data{1});

        // the detached member keeps following its alias
        kept.set("n", 2);
        REQUIRE(removed.get("n") == Data{2});
        REQUIRE(session.are_aliased(kept, removed));
    });
}
