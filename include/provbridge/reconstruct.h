// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file reconstruct.h
/// @brief Rebuild resource inputs after provider-reported field failures.

#pragma once

#include <provbridge/api.h>
#include <provbridge/errors.h>
#include <provbridge/schema.h>

#include <vector>

namespace provbridge {

/// Drop inputs that failed validation when the provider owns them.
///
/// A failure on a Computed and non-Required field removes that field from
/// the returned inputs, so it does not affect later diffs. A failure on any
/// other field (or on a path that cannot be parsed or resolved) is kept, and
/// all kept failures are raised together.
///
/// @throws ValidationError if any failure cannot be dropped
[[nodiscard]] PROVBRIDGE_API Value reconstruct_inputs(const SchemaNode& schema, const Value& inputs,
                                                      const std::vector<ValidationFailure>& failures);

} // namespace provbridge
