// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file rollback.h
/// @brief Log of inverse operations replayed when a scope body fails.
///
/// Before every mutation made through a view, the view records the exact
/// inverse in terms of the view API itself (restore the prior value,
/// truncate back to the prior length, re-insert a removed item, ...).
/// Because inverses go back through the views, they fan out across
/// aliases just like the original mutation did.
///
/// Replay runs the inverses newest-first, once. Logging is suspended while
/// replaying so inverses do not log inverses of their own.

#pragma once

#include <live_tree/api.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace live_tree {

class LIVE_TREE_API RollbackLog {
public:
    using InverseOp = std::function<void()>;

    RollbackLog() = default;
    RollbackLog(const RollbackLog&) = delete;
    RollbackLog& operator=(const RollbackLog&) = delete;

    /// False after invalidate(), during and after execute()
    [[nodiscard]] bool can_rollback() const noexcept { return enabled_ && !replaying_; }

    /// Record an inverse; ignored when logging is not possible
    void log(InverseOp op);

    /// Drop every recorded inverse and stop logging
    void invalidate() noexcept;

    /// Replay recorded inverses in reverse order, then disable the log.
    /// An exception from an inverse stops the replay and propagates.
    void execute();

    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }

private:
    std::vector<InverseOp> ops_;
    bool enabled_ = true;
    bool replaying_ = false;
};

} // namespace live_tree
