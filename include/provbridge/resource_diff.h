// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resource_diff.h
/// @brief Resource-level diff: the entry point used by the RPC handlers.
///
/// @code
///   ResourceDiffRequest req;
///   req.type = "test:index:Resource";
///   req.name = "res";
///   req.schema = schema;
///   req.old_state = decode_state(from_json(state_json));
///   req.new_inputs = from_json(inputs_json);
///
///   ResourceDiff d = diff_resource(req);
///   std::cout << d.preview << wire_to_json(d.wire) << "\n";
/// @endcode
///
/// Each call is independent and touches no shared mutable state, so
/// requests for different resources may run on different threads with
/// the same SchemaPtr.

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>
#include <provbridge/render.h>
#include <provbridge/schema.h>

#include <optional>
#include <string>
#include <vector>

namespace provbridge {

struct ResourceDiffRequest {
    std::string type;
    std::string name;
    SchemaPtr schema;
    Value old_state;   ///< decoded prior state (null for a new resource)
    Value new_inputs;  ///< desired inputs (null for a deleted resource)
    DiffOptions options;
};

struct ResourceDiff {
    DiffResult result;
    ResourceOp op = ResourceOp::Same;
    WireDiff wire;
    std::string preview;
};

struct ResourceOutcome {
    std::string type;
    std::string name;
    std::optional<ResourceDiff> diff;  ///< set on success
    std::string error;                 ///< set on failure

    [[nodiscard]] bool ok() const noexcept { return diff.has_value(); }
};

/// Conform, apply ignore-changes, diff, resolve replacement, apply the
/// replace override, annotate secrets and render.
/// @throws SchemaError, TypeMismatchError, PathParseError
[[nodiscard]] PROVBRIDGE_API ResourceDiff diff_resource(const ResourceDiffRequest& request);

/// Evaluate every request; a failure only affects its own outcome
[[nodiscard]] PROVBRIDGE_API std::vector<ResourceOutcome> diff_resources(
    const std::vector<ResourceDiffRequest>& requests);

} // namespace provbridge
