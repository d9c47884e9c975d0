// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.cpp
/// @brief Reason code names

#include <live_tree/errors.h>

namespace live_tree {

std::string_view to_string(ConversionFailure reason) noexcept {
    switch (reason) {
    case ConversionFailure::UnsupportedType:       return "unsupported-type";
    case ConversionFailure::CyclicStructure:       return "cyclic-structure";
    case ConversionFailure::AlreadyStoreValue:     return "already-store-value";
    case ConversionFailure::AlreadyView:           return "already-view";
    case ConversionFailure::CannotCloneUnparented: return "cannot-clone-unparented";
    case ConversionFailure::NotAContainer:         return "not-a-container";
    }
    return "unknown";
}

std::string_view to_string(AccessFailure reason) noexcept {
    switch (reason) {
    case AccessFailure::Revoked:             return "revoked";
    case AccessFailure::Deleted:             return "deleted";
    case AccessFailure::UnsupportedProperty: return "unsupported-property";
    case AccessFailure::AccessorDefinition:  return "accessor-definition";
    case AccessFailure::NotAView:            return "not-a-view";
    }
    return "unknown";
}

std::string_view to_string(ScopeFailure reason) noexcept {
    switch (reason) {
    case ScopeFailure::NestedScope: return "nested-scope";
    case ScopeFailure::Invalidated: return "invalidated";
    case ScopeFailure::Closed:      return "closed";
    }
    return "unknown";
}

} // namespace live_tree
