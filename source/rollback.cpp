// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file rollback.cpp
/// @brief Implementation of RollbackLog

#include <live_tree/rollback.h>

#include <utility>

namespace live_tree {

void RollbackLog::log(InverseOp op) {
    if (!can_rollback()) return;
    ops_.push_back(std::move(op));
}

void RollbackLog::invalidate() noexcept {
    enabled_ = false;
    ops_.clear();
}

void RollbackLog::execute() {
    if (!enabled_ || replaying_) return;

    replaying_ = true;
    auto ops = std::exchange(ops_, {});
    struct ReplayGuard {
        RollbackLog& log;
        ~ReplayGuard() {
            log.replaying_ = false;
            log.enabled_ = false;
        }
    } guard{*this};

    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        (*it)();
    }
}

} // namespace live_tree
