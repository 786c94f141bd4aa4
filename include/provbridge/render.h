// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render.h
/// @brief Wire-format diff and text preview of a DiffResult.
///
/// Both renderings are pure functions of their arguments.
///
/// Preview example:
/// ```
/// +- aws:instance: web (replace)
///     ~ ami: "ami-1" => "ami-2" [forces replacement]
///     ~ tags:
///         + [0]: "env"
/// ```

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace provbridge {

enum class DiffChanges {
    None,
    Some,
};

enum class ResourceOp {
    Same,
    Create,
    Update,
    Replace,
    Delete,
};

/// Response body of a resource diff
struct WireDiff {
    DiffChanges changes = DiffChanges::None;
    std::vector<std::string> replaces;  ///< top-level properties forcing replacement
    std::vector<std::string> diffs;     ///< top-level properties with changes
    std::map<std::string, PropertyDiffKind> detailed_diff;
    bool has_detailed_diff = true;
};

[[nodiscard]] PROVBRIDGE_API WireDiff to_wire(const DiffResult& result);

/// JSON object with changes, replaces, diffs, detailedDiff and hasDetailedDiff.
/// ADD entries are written as `{}`.
[[nodiscard]] PROVBRIDGE_API std::string wire_to_json(const WireDiff& wire);

/// Operation implied by the trees and the result
[[nodiscard]] PROVBRIDGE_API ResourceOp resource_op(const Value& old_value, const Value& new_value,
                                                    const DiffResult& result);

[[nodiscard]] PROVBRIDGE_API std::string_view to_string(ResourceOp op) noexcept;

/// Line-oriented preview: a header line, then the changed paths as a tree
[[nodiscard]] PROVBRIDGE_API std::string render_preview(std::string_view type, std::string_view name,
                                                        ResourceOp op, const DiffResult& result);

} // namespace provbridge
