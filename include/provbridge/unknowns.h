// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file unknowns.h
/// @brief Unknown and computed-value rules applied at each node of the diff walk.

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>
#include <provbridge/schema.h>

namespace provbridge {

/// What the differ does at a node whose old and new values differ
enum class NodeOutcome {
    Descend,   ///< both sides known: use the kind-specific differ
    Suppress,  ///< no entry (computed value left to the provider)
    Add,
    Delete,
    Update,
};

/// Decide a node before structural comparison.
///
/// - new Unknown: Add against null, Update otherwise (never Delete)
/// - old Unknown: Delete against null, Update otherwise
/// - old null: Add for the whole subtree
/// - new null: Delete, except for a computed and non-required node which is
///   suppressed unless a ForceNew node governs it
///
/// `old_value` and `new_value` must not be equal.
[[nodiscard]] PROVBRIDGE_API NodeOutcome classify_node(const SchemaNode* schema,
                                                      const Value& old_value,
                                                      const Value& new_value,
                                                      bool force_new_governed,
                                                      const DiffOptions& options) noexcept;

/// True if the computed-absent rule hides the change
[[nodiscard]] PROVBRIDGE_API bool left_to_provider(const SchemaNode* schema, const Value& new_value,
                                                   bool force_new_governed,
                                                   const DiffOptions& options) noexcept;

} // namespace provbridge
