// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ignore_changes.h
/// @brief Carry old values over ignored paths before diffing.

#pragma once

#include <provbridge/api.h>
#include <provbridge/path.h>
#include <provbridge/value.h>

#include <string>
#include <vector>

namespace provbridge {

/// Copy of `new_value` with the old value restored at every listed path.
///
/// - `*` matches every key or index present on either side
/// - a last segment present only in new is removed, one present only in
///   old is restored
/// - paths that do not resolve on both sides are skipped
///
/// @throws PathParseError listing every unparsable path
[[nodiscard]] PROVBRIDGE_API Value apply_ignore_changes(const Value& old_value, const Value& new_value,
                                                        const std::vector<std::string>& paths);

/// @copydoc apply_ignore_changes
[[nodiscard]] PROVBRIDGE_API Value apply_ignore_changes(const Value& old_value, const Value& new_value,
                                                        const std::vector<PropertyPath>& paths);

} // namespace provbridge
