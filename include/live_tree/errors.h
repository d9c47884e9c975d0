// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by live_tree.
///
/// Every error is raised synchronously at the point of violation and
/// carries a reason code so callers can branch without parsing messages.

#pragma once

#include <live_tree/api.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace live_tree {

/// Base class of all live_tree errors
class LIVE_TREE_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================
// ConversionError
// ============================================================

enum class ConversionFailure {
    UnsupportedType,       ///< not plain, not raw, not a store node, not a blob
    CyclicStructure,       ///< a plain container contains itself
    AlreadyStoreValue,     ///< a store node was given where a plain value is required
    AlreadyView,           ///< a view was given where a plain value is required
    CannotCloneUnparented, ///< the same unparented store node was seen twice
    NotAContainer          ///< a primitive was given where a map or sequence is required
};

class LIVE_TREE_API ConversionError : public Error {
public:
    ConversionError(ConversionFailure reason, const std::string& message)
        : Error(message), reason_(reason) {}

    [[nodiscard]] ConversionFailure reason() const noexcept { return reason_; }

private:
    ConversionFailure reason_;
};

// ============================================================
// AccessError
// ============================================================

enum class AccessFailure {
    Revoked,             ///< the view's scope has closed or was invalidated
    Deleted,             ///< the backing store node was deleted
    UnsupportedProperty, ///< symbolic key on a map, custom key on a sequence
    AccessorDefinition,  ///< getter/setter property definitions
    NotAView             ///< a view was required
};

class LIVE_TREE_API AccessError : public Error {
public:
    AccessError(AccessFailure reason, const std::string& message)
        : Error(message), reason_(reason) {}

    [[nodiscard]] AccessFailure reason() const noexcept { return reason_; }

private:
    AccessFailure reason_;
};

// ============================================================
// ScopeError
// ============================================================

enum class ScopeFailure {
    NestedScope, ///< a scope is already open on this session
    Invalidated, ///< transact() after a foreign origin invalidated the scope
    Closed       ///< transact() after the scope was torn down
};

class LIVE_TREE_API ScopeError : public Error {
public:
    ScopeError(ScopeFailure reason, const std::string& message)
        : Error(message), reason_(reason) {}

    [[nodiscard]] ScopeFailure reason() const noexcept { return reason_; }

private:
    ScopeFailure reason_;
};

[[nodiscard]] LIVE_TREE_API std::string_view to_string(ConversionFailure reason) noexcept;
[[nodiscard]] LIVE_TREE_API std::string_view to_string(AccessFailure reason) noexcept;
[[nodiscard]] LIVE_TREE_API std::string_view to_string(ScopeFailure reason) noexcept;

} // namespace live_tree
