// main.cpp
// live_tree basic example - editing a shared document through live views
//
// Walks through the main ideas of the library:
//
// 1. Auto scopes: every write in the body is one transaction
// 2. Aliases: the same plain container written twice stays in sync
// 3. Detached views: a removed subtree keeps working off-store
// 4. Manual scopes: explicit batches and invalidation by other writers
// 5. Rollback: a failing body leaves the document untouched

#include <live_tree/live_tree.h>

#include <iostream>
#include <stdexcept>

using namespace live_tree;

namespace {

void print(const char* label, const Value& value) {
    std::cout << "  " << label << ": " << to_json(value) << "\n";
}

} // anonymous namespace

int main() {
    Doc doc;
    Session session;
    auto root = doc.get_map("root");

    ScopedConnection changes = root->observe_deep([](const std::vector<ChangeEvent>& events, const Transaction& txn) {
        std::cout << "  [txn] " << events.size() << " container(s) changed, origin="
                  << txn.origin.value_or("<none>") << "\n";
    });

    // ============================================================
    // 1. Auto scope
    // ============================================================
    std::cout << "== auto scope ==\n";
    session.with_views(root, [](MapView r) {
        r.set("title", "Shopping");
        r.set("items", Data::array({"milk", "bread"}));
        r.get("items").as_array().push_back("eggs");
    }, {.origin = "example"});
    print("root", root->to_plain());

    // ============================================================
    // 2. Aliases
    // ============================================================
    std::cout << "\n== aliases ==\n";
    session.with_views(root, [&](MapView r) {
        auto address = Data::map({{"city", "Lyon"}});
        r.set("billing", address);
        r.set("shipping", address);

        r.get("shipping").as_map().set("city", "Paris");
        std::cout << "  aliased: " << std::boolalpha << session.are_aliased(r.get("billing"), r.get("shipping"))
                  << ", billing city: " << data_to_string(r.get("billing").as_map().get("city")) << "\n";
    });

    // ============================================================
    // 3. Detached views
    // ============================================================
    std::cout << "\n== detached views ==\n";
    session.with_views(root, [&](MapView r) {
        auto items = r.get("items").as_array();
        r.erase("items");
        items.push_back("butter");
        std::cout << "  attached: " << std::boolalpha << items.is_attached() << "\n";
        print("detached items", items.to_json());

        r.set("restored", items);
        std::cout << "  re-attached: " << items.is_attached() << "\n";
    });
    print("root", root->to_plain());

    // ============================================================
    // 4. Manual scope
    // ============================================================
    std::cout << "\n== manual scope ==\n";
    session.with_views_manual(root, [&](MapView r, const ManualContext& ctx) {
        ctx.transact([&] {
            r.set("title", "Groceries");
            r.set("count", 4);
        });

        // another writer touches the document
        doc.transact([&] { root->set("remote", Value{true}); }, "remote");
        std::cout << "  invalidated: " << std::boolalpha << ctx.is_invalidated() << "\n";

        try {
            ctx.transact([&] { r.set("late", 1); });
        } catch (const ScopeError& e) {
            std::cout << "  " << to_string(e.reason()) << ": " << e.what() << "\n";
        }
    });

    // ============================================================
    // 5. Rollback
    // ============================================================
    std::cout << "\n== rollback ==\n";
    try {
        session.with_views(root, [](MapView r) {
            r.set("title", "Broken");
            r.get("restored").as_array().resize(0);
            throw std::runtime_error("validation failed");
        }, {.rollback_on_error = true});
    } catch (const std::exception& e) {
        std::cout << "  body failed: " << e.what() << "\n";
    }
    print("root", root->to_plain());

    std::cout << "\nlive views after all scopes: " << session.live_view_count() << "\n";
    return 0;
}
