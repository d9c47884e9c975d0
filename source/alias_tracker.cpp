// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file alias_tracker.cpp
/// @brief Implementation of AliasTracker

#include <live_tree/alias_tracker.h>

namespace live_tree {
namespace detail {

void AliasTracker::link_nodes(const SharedTypePtr& a, const SharedTypePtr& b) {
    if (!a || !b || a == b) return;
    nodes_[a->id()] = a;
    nodes_[b->id()] = b;
    node_groups_.link(a->id(), b->id());
}

std::vector<SharedTypePtr> AliasTracker::node_siblings(const SharedType& node) {
    std::vector<SharedTypePtr> result;
    std::vector<NodeId> expired;

    for (auto id : node_groups_.siblings(node.id())) {
        auto it = nodes_.find(id);
        auto sibling = it == nodes_.end() ? nullptr : it->second.lock();
        if (!sibling) {
            expired.push_back(id);
            continue;
        }
        if (sibling->is_deleted() || sibling->doc() != node.doc()) continue;
        result.push_back(std::move(sibling));
    }

    for (auto id : expired) {
        unlink_node(id);
    }
    return result;
}

void AliasTracker::unlink_node(NodeId id) {
    if (auto orphan = node_groups_.remove(id)) {
        nodes_.erase(*orphan);
    }
    nodes_.erase(id);
}

void AliasTracker::link_views(std::uint32_t a, std::uint32_t b) {
    view_groups_.link(a, b);
}

std::vector<std::uint32_t> AliasTracker::view_siblings(std::uint32_t slot) const {
    return view_groups_.siblings(slot);
}

bool AliasTracker::views_linked(std::uint32_t a, std::uint32_t b) const {
    return a != b && view_groups_.same_group(a, b);
}

void AliasTracker::unlink_view(std::uint32_t slot) {
    view_groups_.remove(slot);
}

AliasTracker::Stats AliasTracker::stats() const noexcept {
    return Stats{node_groups_.member_count(), view_groups_.member_count()};
}

} // namespace detail
} // namespace live_tree
