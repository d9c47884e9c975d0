// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file store.h
/// @brief In-process shared document store: maps, sequences, transactions.
///
/// This is the store adapter the view layer is written against. It provides
/// the minimal contract of a CRDT document without any merge logic:
///
/// - Doc owns named root types and runs transactions tagged with an origin.
///   Nested transact() calls join the outer one; a mutation issued outside
///   any transaction runs in an implicit one.
/// - SharedMap / SharedArray hold Content (a frozen Value or a child node).
///   Every node has exactly one parent; inserting an already parented node
///   throws std::invalid_argument.
/// - Removing a node from its parent marks the whole subtree deleted.
///   Destroying the Doc deletes every node it owns.
/// - observe_deep() delivers the changes of a node and its descendants
///   once the outermost transaction has committed.
///
/// @code
///   Doc doc;
///   auto root = doc.get_map("root");
///   doc.transact([&] {
///       root->set("title", Value{"draft"});
///       root->set("tags", SharedArray::create());
///   }, "local");
/// @endcode

#pragma once

#include <live_tree/api.h>
#include <live_tree/connection.h>
#include <live_tree/value.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace live_tree {

class Doc;
class SharedType;
class SharedMap;
class SharedArray;

using NodeId         = std::uint64_t;
using Origin         = std::string;
using SharedTypePtr  = std::shared_ptr<SharedType>;
using SharedMapPtr   = std::shared_ptr<SharedMap>;
using SharedArrayPtr = std::shared_ptr<SharedArray>;

/// A slot value inside a map or sequence
using Content = std::variant<Value, SharedMapPtr, SharedArrayPtr>;

/// A container node (map or sequence)
using StoreNode = std::variant<SharedMapPtr, SharedArrayPtr>;

enum class NodeKind { Map, Array };

/// One changed container within a committed transaction
struct ChangeEvent {
    SharedTypePtr target;
};

struct Transaction {
    Doc* doc = nullptr;
    std::optional<Origin> origin;
    std::vector<SharedTypePtr> changed;
};

using DeepObserver = std::function<void(const std::vector<ChangeEvent>&, const Transaction&)>;

/// @brief Node pointer of a container Content, or nullptr for a Value
[[nodiscard]] LIVE_TREE_API SharedTypePtr content_node(const Content& content);

/// @brief Node pointer of a StoreNode
[[nodiscard]] LIVE_TREE_API SharedTypePtr store_node_ptr(const StoreNode& node);

// ============================================================
// SharedType - common base of map and sequence nodes
// ============================================================

class LIVE_TREE_API SharedType : public std::enable_shared_from_this<SharedType> {
public:
    virtual ~SharedType();

    SharedType(const SharedType&) = delete;
    SharedType& operator=(const SharedType&) = delete;

    [[nodiscard]] NodeId id() const noexcept { return id_; }
    [[nodiscard]] virtual NodeKind kind() const noexcept = 0;

    /// Owning document (nullptr for unparented nodes and deleted nodes)
    [[nodiscard]] Doc* doc() const noexcept { return doc_; }
    [[nodiscard]] SharedType* parent() const noexcept { return parent_; }

    /// True once the node is part of a document or of another node.
    /// Stays true after deletion: a deleted node can never be re-inserted.
    [[nodiscard]] bool is_parented() const noexcept {
        return doc_ != nullptr || parent_ != nullptr || deleted_;
    }

    [[nodiscard]] bool is_deleted() const noexcept { return deleted_; }

    /// Recursive frozen snapshot of the node
    [[nodiscard]] virtual Value to_plain() const = 0;

    /// Deep copy with fresh ids, not attached anywhere
    [[nodiscard]] virtual SharedTypePtr clone_node() const = 0;

    /// Observe changes to this node and all of its descendants
    [[nodiscard]] Connection observe_deep(DeepObserver observer);

protected:
    SharedType();

    void check_alive(const char* op) const;

    /// Validate and take ownership of a child (throws on double parenting)
    void adopt(const Content& content);

    /// Mark a removed child and its subtree deleted
    static void release(const Content& content) noexcept;

    /// Run a mutation inside the document transaction (or directly when unparented)
    void mutate(const std::function<void()>& fn);

    virtual void for_each_child(const std::function<void(SharedType&)>& fn) const = 0;

private:
    friend class Doc;

    struct ObserverEntry {
        std::uint64_t id;
        DeepObserver fn;
    };

    void integrate(Doc* doc, SharedType* parent) noexcept;
    void set_doc_recursive(Doc* doc) noexcept;
    void mark_deleted() noexcept;
    [[nodiscard]] bool is_self_or_ancestor(const SharedType* node) const noexcept;

    NodeId id_;
    Doc* doc_ = nullptr;
    SharedType* parent_ = nullptr;
    bool deleted_ = false;
    std::vector<ObserverEntry> observers_;
    std::uint64_t next_observer_id_ = 1;
};

// ============================================================
// SharedMap
// ============================================================

class LIVE_TREE_API SharedMap final : public SharedType {
public:
    [[nodiscard]] static SharedMapPtr create();

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Map; }

    /// Pointer to the slot, nullptr when absent
    [[nodiscard]] const Content* find(const std::string& key) const;
    [[nodiscard]] std::optional<Content> get(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] const std::map<std::string, Content>& entries() const noexcept { return entries_; }

    void set(const std::string& key, Content value);
    bool erase(const std::string& key);
    void clear();

    [[nodiscard]] SharedMapPtr clone() const;
    [[nodiscard]] SharedTypePtr clone_node() const override { return clone(); }
    [[nodiscard]] Value to_plain() const override;

protected:
    void for_each_child(const std::function<void(SharedType&)>& fn) const override;

private:
    SharedMap() = default;

    std::map<std::string, Content> entries_;
};

// ============================================================
// SharedArray
// ============================================================

class LIVE_TREE_API SharedArray final : public SharedType {
public:
    [[nodiscard]] static SharedArrayPtr create();

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::Array; }

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    /// @throws std::out_of_range
    [[nodiscard]] const Content& at(std::size_t index) const;
    [[nodiscard]] std::optional<Content> get(std::size_t index) const;
    [[nodiscard]] std::vector<Content> slice(std::size_t start, std::size_t end) const;
    [[nodiscard]] const std::vector<Content>& items() const noexcept { return items_; }

    /// @throws std::out_of_range when index > size()
    void insert(std::size_t index, std::vector<Content> values);
    void push_back(Content value);
    /// @throws std::out_of_range when the range exceeds size()
    void erase(std::size_t index, std::size_t count = 1);

    [[nodiscard]] SharedArrayPtr clone() const;
    [[nodiscard]] SharedTypePtr clone_node() const override { return clone(); }
    [[nodiscard]] Value to_plain() const override;

protected:
    void for_each_child(const std::function<void(SharedType&)>& fn) const override;

private:
    SharedArray() = default;

    std::vector<Content> items_;
};

// ============================================================
// Doc
// ============================================================

class LIVE_TREE_API Doc {
public:
    struct Stats {
        std::size_t transactions = 0; ///< committed outermost transactions
        std::size_t changes = 0;      ///< container mutations recorded
    };

    Doc();
    ~Doc();

    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;
    Doc(Doc&&) = delete;
    Doc& operator=(Doc&&) = delete;

    /// Get or create a named root map
    /// @throws std::logic_error if the name is a root sequence
    [[nodiscard]] SharedMapPtr get_map(const std::string& name);

    /// Get or create a named root sequence
    /// @throws std::logic_error if the name is a root map
    [[nodiscard]] SharedArrayPtr get_array(const std::string& name);

    /// Run fn in a transaction tagged with origin. Joins the active
    /// transaction when called from inside one (the outer origin wins).
    /// Changes made before fn throws are still committed.
    void transact(const std::function<void()>& fn, std::optional<Origin> origin = std::nullopt);

    [[nodiscard]] bool in_transaction() const noexcept { return current_ != nullptr; }
    [[nodiscard]] const Transaction* current_transaction() const noexcept { return current_.get(); }

    [[nodiscard]] Connection on_after_transaction(std::function<void(const Transaction&)> fn);

    /// Delete every node owned by the document
    void destroy() noexcept;
    [[nodiscard]] bool is_destroyed() const noexcept { return destroyed_; }

    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

private:
    friend class SharedType;

    struct Listeners {
        std::vector<std::pair<std::uint64_t, std::function<void(const Transaction&)>>> entries;
        std::uint64_t next_id = 1;
    };

    void record_change(SharedType& node);
    void commit(Transaction& txn);

    std::map<std::string, SharedTypePtr> roots_;
    std::unique_ptr<Transaction> current_;
    std::shared_ptr<Listeners> listeners_;
    Stats stats_;
    bool destroyed_ = false;
};

} // namespace live_tree
