// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file secrets.h
/// @brief Secret propagation and the persisted-state secret sentinel.
///
/// A node is secret when its schema is sensitive or when any source tree
/// (new inputs, prior inputs, prior outputs) holds a secret at the same path.
/// A secret anywhere inside a source Set marks the whole target Set, since
/// set elements have no stable position.
///
/// Persisted state wraps each secret node as
///
/// ```
/// {"4dabf18193072939515e22adb298388d": "1b47061264138c4ac30d75fd1eb44270", "value": <v>}
/// ```

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>
#include <provbridge/schema.h>

#include <string_view>
#include <vector>

namespace provbridge {

inline constexpr std::string_view kSecretSigKey = "4dabf18193072939515e22adb298388d";
inline constexpr std::string_view kSecretSigValue = "1b47061264138c4ac30d75fd1eb44270";

/// Copy of `target` with secret bits added from the schema and the sources
[[nodiscard]] PROVBRIDGE_API Value propagate_secrets(const SchemaNode& schema, const Value& target,
                                                     const std::vector<Value>& sources);

/// Replace every secret node by the sentinel wrapper
[[nodiscard]] PROVBRIDGE_API Value encode_state(const Value& value);

/// Turn sentinel wrappers back into secret nodes
[[nodiscard]] PROVBRIDGE_API Value decode_state(const Value& value);

/// True if `value` is a sentinel wrapper
[[nodiscard]] PROVBRIDGE_API bool is_secret_sentinel(const Value& value);

/// propagate_secrets() followed by encode_state(): the form written to the state store
[[nodiscard]] PROVBRIDGE_API Value persist_state(const SchemaNode& schema, const Value& outputs,
                                                 const std::vector<Value>& sources);

/// Mark entries whose path is sensitive in the schema or secret in either tree
PROVBRIDGE_API void annotate_secrets(const SchemaNode& schema, const Value& old_value,
                                     const Value& new_value, DiffResult& result);

} // namespace provbridge
