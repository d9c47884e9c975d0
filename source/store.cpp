// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file store.cpp
/// @brief Implementation of the in-process document store

#include <live_tree/store.h>
#include <live_tree/builders.h>

#include <tsl/robin_set.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace live_tree {

namespace {

NodeId next_node_id() noexcept {
    static std::atomic<NodeId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

Content clone_content(const Content& content) {
    if (auto* map = std::get_if<SharedMapPtr>(&content)) return (*map)->clone();
    if (auto* arr = std::get_if<SharedArrayPtr>(&content)) return (*arr)->clone();
    return content;
}

Value content_to_plain(const Content& content) {
    if (auto node = content_node(content)) return node->to_plain();
    return std::get<Value>(content);
}

} // anonymous namespace

SharedTypePtr content_node(const Content& content) {
    if (auto* map = std::get_if<SharedMapPtr>(&content)) return *map;
    if (auto* arr = std::get_if<SharedArrayPtr>(&content)) return *arr;
    return nullptr;
}

SharedTypePtr store_node_ptr(const StoreNode& node) {
    return std::visit([](const auto& ptr) -> SharedTypePtr { return ptr; }, node);
}

// ============================================================
// SharedType
// ============================================================

SharedType::SharedType() : id_(next_node_id()) {}

SharedType::~SharedType() = default;

Connection SharedType::observe_deep(DeepObserver observer) {
    const auto id = next_observer_id_++;
    observers_.push_back(ObserverEntry{id, std::move(observer)});
    return Connection([weak = weak_from_this(), id] {
        if (auto self = weak.lock()) {
            auto& list = self->observers_;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [id](const ObserverEntry& e) { return e.id == id; }),
                       list.end());
        }
    });
}

void SharedType::check_alive(const char* op) const {
    if (deleted_) {
        throw std::logic_error(std::string(op) + ": node has been deleted");
    }
}

void SharedType::adopt(const Content& content) {
    auto node = content_node(content);
    if (!node) return;
    if (node->is_parented()) {
        throw std::invalid_argument("store node already has a parent");
    }
    if (node->is_self_or_ancestor(this)) {
        throw std::invalid_argument("store node cannot contain itself");
    }
    node->integrate(doc_, this);
}

void SharedType::release(const Content& content) noexcept {
    if (auto node = content_node(content)) {
        node->mark_deleted();
    }
}

void SharedType::mutate(const std::function<void()>& fn) {
    if (!doc_) {
        fn();
        return;
    }
    doc_->transact([&] {
        fn();
        doc_->record_change(*this);
    });
}

void SharedType::integrate(Doc* doc, SharedType* parent) noexcept {
    parent_ = parent;
    set_doc_recursive(doc);
}

void SharedType::set_doc_recursive(Doc* doc) noexcept {
    doc_ = doc;
    for_each_child([doc](SharedType& child) { child.set_doc_recursive(doc); });
}

void SharedType::mark_deleted() noexcept {
    deleted_ = true;
    parent_ = nullptr;
    doc_ = nullptr;
    for_each_child([](SharedType& child) { child.mark_deleted(); });
}

bool SharedType::is_self_or_ancestor(const SharedType* node) const noexcept {
    for (auto* cur = node; cur != nullptr; cur = cur->parent_) {
        if (cur == this) return true;
    }
    return false;
}

// ============================================================
// SharedMap
// ============================================================

SharedMapPtr SharedMap::create() {
    return SharedMapPtr(new SharedMap());
}

const Content* SharedMap::find(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<Content> SharedMap::get(const std::string& key) const {
    if (auto* found = find(key)) return *found;
    return std::nullopt;
}

bool SharedMap::contains(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::vector<std::string> SharedMap::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        result.push_back(key);
    }
    return result;
}

void SharedMap::set(const std::string& key, Content value) {
    check_alive("SharedMap::set");
    adopt(value);
    mutate([&] {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            release(it->second);
            it->second = std::move(value);
        } else {
            entries_.emplace(key, std::move(value));
        }
    });
}

bool SharedMap::erase(const std::string& key) {
    check_alive("SharedMap::erase");
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    mutate([&] {
        release(it->second);
        entries_.erase(it);
    });
    return true;
}

void SharedMap::clear() {
    check_alive("SharedMap::clear");
    if (entries_.empty()) return;
    mutate([&] {
        for (const auto& [_, content] : entries_) {
            release(content);
        }
        entries_.clear();
    });
}

SharedMapPtr SharedMap::clone() const {
    auto copy = create();
    for (const auto& [key, content] : entries_) {
        copy->set(key, clone_content(content));
    }
    return copy;
}

Value SharedMap::to_plain() const {
    MapBuilder builder;
    for (const auto& [key, content] : entries_) {
        builder.set(key, content_to_plain(content));
    }
    return builder.finish();
}

void SharedMap::for_each_child(const std::function<void(SharedType&)>& fn) const {
    for (const auto& [_, content] : entries_) {
        if (auto node = content_node(content)) fn(*node);
    }
}

// ============================================================
// SharedArray
// ============================================================

SharedArrayPtr SharedArray::create() {
    return SharedArrayPtr(new SharedArray());
}

const Content& SharedArray::at(std::size_t index) const {
    if (index >= items_.size()) {
        throw std::out_of_range("SharedArray::at: index " + std::to_string(index) + " out of range");
    }
    return items_[index];
}

std::optional<Content> SharedArray::get(std::size_t index) const {
    if (index >= items_.size()) return std::nullopt;
    return items_[index];
}

std::vector<Content> SharedArray::slice(std::size_t start, std::size_t end) const {
    end = std::min(end, items_.size());
    if (start >= end) return {};
    return std::vector<Content>(items_.begin() + static_cast<std::ptrdiff_t>(start),
                                items_.begin() + static_cast<std::ptrdiff_t>(end));
}

void SharedArray::insert(std::size_t index, std::vector<Content> values) {
    check_alive("SharedArray::insert");
    if (index > items_.size()) {
        throw std::out_of_range("SharedArray::insert: index " + std::to_string(index) + " out of range");
    }
    if (values.empty()) return;

    tsl::robin_set<const SharedType*> seen;
    for (const auto& value : values) {
        if (auto node = content_node(value); node && !seen.insert(node.get()).second) {
            throw std::invalid_argument("store node inserted twice");
        }
    }
    for (const auto& value : values) {
        adopt(value);
    }
    mutate([&] {
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index),
                      std::make_move_iterator(values.begin()),
                      std::make_move_iterator(values.end()));
    });
}

void SharedArray::push_back(Content value) {
    std::vector<Content> values;
    values.push_back(std::move(value));
    insert(items_.size(), std::move(values));
}

void SharedArray::erase(std::size_t index, std::size_t count) {
    check_alive("SharedArray::erase");
    if (count == 0) return;
    if (index > items_.size() || count > items_.size() - index) {
        throw std::out_of_range("SharedArray::erase: range out of bounds");
    }
    mutate([&] {
        auto first = items_.begin() + static_cast<std::ptrdiff_t>(index);
        auto last = first + static_cast<std::ptrdiff_t>(count);
        for (auto it = first; it != last; ++it) {
            release(*it);
        }
        items_.erase(first, last);
    });
}

SharedArrayPtr SharedArray::clone() const {
    auto copy = create();
    std::vector<Content> values;
    values.reserve(items_.size());
    for (const auto& content : items_) {
        values.push_back(clone_content(content));
    }
    copy->insert(0, std::move(values));
    return copy;
}

Value SharedArray::to_plain() const {
    VectorBuilder builder;
    for (const auto& content : items_) {
        builder.push_back(content_to_plain(content));
    }
    return builder.finish();
}

void SharedArray::for_each_child(const std::function<void(SharedType&)>& fn) const {
    for (const auto& content : items_) {
        if (auto node = content_node(content)) fn(*node);
    }
}

// ============================================================
// Doc
// ============================================================

Doc::Doc() : listeners_(std::make_shared<Listeners>()) {}

Doc::~Doc() {
    destroy();
}

SharedMapPtr Doc::get_map(const std::string& name) {
    auto it = roots_.find(name);
    if (it != roots_.end()) {
        if (it->second->kind() != NodeKind::Map) {
            throw std::logic_error("root '" + name + "' is not a map");
        }
        return std::static_pointer_cast<SharedMap>(it->second);
    }
    auto root = SharedMap::create();
    root->integrate(this, nullptr);
    roots_.emplace(name, root);
    return root;
}

SharedArrayPtr Doc::get_array(const std::string& name) {
    auto it = roots_.find(name);
    if (it != roots_.end()) {
        if (it->second->kind() != NodeKind::Array) {
            throw std::logic_error("root '" + name + "' is not a sequence");
        }
        return std::static_pointer_cast<SharedArray>(it->second);
    }
    auto root = SharedArray::create();
    root->integrate(this, nullptr);
    roots_.emplace(name, root);
    return root;
}

void Doc::transact(const std::function<void()>& fn, std::optional<Origin> origin) {
    if (current_) {
        fn();
        return;
    }

    current_ = std::make_unique<Transaction>();
    current_->doc = this;
    current_->origin = std::move(origin);

    try {
        fn();
    } catch (...) {
        auto txn = std::move(current_);
        commit(*txn);
        throw;
    }
    auto txn = std::move(current_);
    commit(*txn);
}

Connection Doc::on_after_transaction(std::function<void(const Transaction&)> fn) {
    const auto id = listeners_->next_id++;
    listeners_->entries.emplace_back(id, std::move(fn));
    return Connection([weak = std::weak_ptr<Listeners>(listeners_), id] {
        if (auto list = weak.lock()) {
            auto& entries = list->entries;
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [id](const auto& e) { return e.first == id; }),
                          entries.end());
        }
    });
}

void Doc::destroy() noexcept {
    if (destroyed_) return;
    destroyed_ = true;
    for (auto& [_, root] : roots_) {
        root->mark_deleted();
    }
}

void Doc::record_change(SharedType& node) {
    if (!current_) return;
    ++stats_.changes;
    auto ptr = node.shared_from_this();
    if (std::find(current_->changed.begin(), current_->changed.end(), ptr) == current_->changed.end()) {
        current_->changed.push_back(std::move(ptr));
    }
}

void Doc::commit(Transaction& txn) {
    ++stats_.transactions;

    // Group events by every observed ancestor (inclusive) of each changed node
    std::vector<std::pair<SharedTypePtr, std::vector<ChangeEvent>>> buckets;
    for (const auto& changed : txn.changed) {
        if (changed->is_deleted()) continue;
        for (auto* cur = changed.get(); cur != nullptr; cur = cur->parent_) {
            if (cur->observers_.empty()) continue;
            auto it = std::find_if(buckets.begin(), buckets.end(),
                                   [cur](const auto& b) { return b.first.get() == cur; });
            if (it == buckets.end()) {
                buckets.emplace_back(cur->shared_from_this(), std::vector<ChangeEvent>{});
                it = std::prev(buckets.end());
            }
            it->second.push_back(ChangeEvent{changed});
        }
    }

    for (const auto& [node, events] : buckets) {
        auto observers = node->observers_;
        for (const auto& entry : observers) {
            entry.fn(events, txn);
        }
    }

    auto listeners = listeners_->entries;
    for (const auto& [_, fn] : listeners) {
        fn(txn);
    }
}

} // namespace live_tree
