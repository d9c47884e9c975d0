// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file live_tree.h
/// @brief Convenience header pulling in the whole public API.

#pragma once

#include <live_tree/live_tree_config.h>

#include <live_tree/api.h>
#include <live_tree/builders.h>
#include <live_tree/connection.h>
#include <live_tree/data.h>
#include <live_tree/errors.h>
#include <live_tree/rollback.h>
#include <live_tree/session.h>
#include <live_tree/store.h>
#include <live_tree/value.h>
#include <live_tree/view.h>
