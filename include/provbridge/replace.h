// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file replace.h
/// @brief ForceNew aggregation over a diff result.

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>
#include <provbridge/schema.h>

#include <optional>

namespace provbridge {

/// Path of the synthetic entry added when a replace is forced
inline const PropertyPath kMetaPath{std::string{"__meta"}};

/// Set `replace` on every entry whose path passes through a ForceNew node
/// or whose old/new subtree differs at a ForceNew node below it, and set
/// DiffResult::replace to the OR of all entries.
PROVBRIDGE_API void resolve_replace(const SchemaNode& schema, DiffResult& result);

/// Clear every replace bit. A created resource never replaces.
PROVBRIDGE_API void clear_replace(DiffResult& result);

/// Apply an explicit replace decision.
///
/// - nullopt: no change
/// - true: the result replaces; when no entry replaces, an UPDATE_REPLACE
///   entry is added at `__meta`
/// - false: every replace bit is cleared
PROVBRIDGE_API void apply_replace_override(DiffResult& result, std::optional<bool> replace_override);

} // namespace provbridge
