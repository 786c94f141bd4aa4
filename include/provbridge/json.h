// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json.h
/// @brief JSON codec for value trees.
///
/// Usage:
/// @code
///   Value v = from_json(R"({"name": "web", "ports": [80, 443]})");
///   std::string s = to_json(v, true);  // {"name":"web","ports":[80,443]}
/// @endcode
///
/// Object keys are written in sorted order so output is reproducible.
/// Sets are written as arrays in canonical order. Unknown values travel as
/// the string kUnknownSentinel, which from_json turns back into Unknown.
/// The secret bit is not written; see encode_state() for persisted state.

#pragma once

#include <provbridge/api.h>
#include <provbridge/errors.h>
#include <provbridge/value.h>

#include <string>
#include <string_view>

namespace provbridge {

/// Wire stand-in for a value that is not known yet
inline constexpr std::string_view kUnknownSentinel = "04da6b54-80e4-46f7-96ec-b56ff0331ba9";

/// Serialize to JSON.
/// @param compact true for a single line without spaces, false for 2-space indentation
[[nodiscard]] PROVBRIDGE_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON. Integers and decimals both become numbers.
/// @throws JsonError on malformed input
[[nodiscard]] PROVBRIDGE_API Value from_json(std::string_view json);

} // namespace provbridge
