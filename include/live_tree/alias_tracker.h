// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file alias_tracker.h
/// @brief Alias groups at store-node level and at view level.
///
/// Two values are aliases when they were derived from the same source value
/// (the same plain container converted twice, or a store node and its clone).
/// Writes through one alias are mirrored to every other member.
///
/// Node-level groups are keyed by NodeId and lose a member when that node is
/// detached or deleted. View-level groups are keyed by view slot and survive
/// attach/detach transitions; they lose a member when the view is revoked.
///
/// Groups only ever merge. A group that would shrink to one member is dropped.

#pragma once

#include <live_tree/api.h>
#include <live_tree/store.h>

#include <tsl/robin_map.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace live_tree {
namespace detail {

/// Disjoint groups of keys. Each key maps to the shared member list of its group.
template <typename Key>
class AliasGroups {
public:
    using Group = std::vector<Key>;

    void link(Key a, Key b) {
        if (a == b) return;
        auto ga = find(a);
        auto gb = find(b);
        if (ga && gb) {
            if (ga == gb) return;
            // merge the smaller group into the larger one
            if (ga->size() < gb->size()) std::swap(ga, gb);
            for (const auto& key : *gb) {
                ga->push_back(key);
                groups_[key] = ga;
            }
            return;
        }
        if (ga) {
            ga->push_back(b);
            groups_[b] = ga;
            return;
        }
        if (gb) {
            gb->push_back(a);
            groups_[a] = gb;
            return;
        }
        auto group = std::make_shared<Group>(Group{a, b});
        groups_[a] = group;
        groups_[b] = group;
    }

    /// All other members of key's group
    [[nodiscard]] std::vector<Key> siblings(Key key) const {
        std::vector<Key> result;
        if (auto group = find(key)) {
            for (const auto& member : *group) {
                if (member != key) result.push_back(member);
            }
        }
        return result;
    }

    [[nodiscard]] bool same_group(Key a, Key b) const {
        auto ga = find(a);
        return ga && ga == find(b);
    }

    /// Remove key from its group.
    /// @return the last remaining member when the group collapsed
    std::optional<Key> remove(Key key) {
        auto it = groups_.find(key);
        if (it == groups_.end()) return std::nullopt;
        auto group = it->second;
        groups_.erase(it);
        std::erase(*group, key);
        if (group->size() != 1) return std::nullopt;
        Key orphan = group->front();
        groups_.erase(orphan);
        group->clear();
        return orphan;
    }

    [[nodiscard]] std::size_t member_count() const noexcept { return groups_.size(); }

private:
    [[nodiscard]] std::shared_ptr<Group> find(Key key) const {
        auto it = groups_.find(key);
        return it == groups_.end() ? nullptr : it->second;
    }

    tsl::robin_map<Key, std::shared_ptr<Group>> groups_;
};

class LIVE_TREE_API AliasTracker {
public:
    struct Stats {
        std::size_t aliased_nodes = 0; ///< nodes currently in a node-level group
        std::size_t aliased_views = 0; ///< view slots currently in a view-level group
    };

    // ===== node level =====

    void link_nodes(const SharedTypePtr& a, const SharedTypePtr& b);

    /// Live, non-deleted members of node's group that share its document
    [[nodiscard]] std::vector<SharedTypePtr> node_siblings(const SharedType& node);

    void unlink_node(NodeId id);

    // ===== view level =====

    void link_views(std::uint32_t a, std::uint32_t b);
    [[nodiscard]] std::vector<std::uint32_t> view_siblings(std::uint32_t slot) const;
    [[nodiscard]] bool views_linked(std::uint32_t a, std::uint32_t b) const;
    void unlink_view(std::uint32_t slot);

    [[nodiscard]] Stats stats() const noexcept;

private:
    AliasGroups<NodeId> node_groups_;
    AliasGroups<std::uint32_t> view_groups_;
    tsl::robin_map<NodeId, std::weak_ptr<SharedType>> nodes_;
};

} // namespace detail
} // namespace live_tree
