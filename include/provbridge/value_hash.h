// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_hash.h
/// @brief Structural hashing, total ordering and canonical set construction.
///
/// The structural hash identifies set elements by content:
/// - scalars hash their value together with a type tag
/// - lists combine element hashes in order
/// - sets combine element hashes in canonical order (so element order never matters)
/// - maps combine key/value hashes in sorted key order
///
/// The hash is deterministic for a given build. It is undefined (nullopt)
/// for trees containing an Unknown: a value that is not known yet has no
/// content identity. The secret bit is ignored.

#pragma once

#include <provbridge/api.h>
#include <provbridge/value.h>

#include <compare>
#include <cstddef>
#include <optional>
#include <vector>

namespace provbridge {

/// Structural hash, or nullopt if the tree contains an Unknown
[[nodiscard]] PROVBRIDGE_API std::optional<std::size_t> hash_value(const Value& val);

/// Total order over values: by kind first, then by content.
/// Consistent with operator== (secret bit ignored).
[[nodiscard]] PROVBRIDGE_API std::strong_ordering compare_values(const Value& a, const Value& b);

/// Build a canonical set from arbitrary elements; duplicates collapse
[[nodiscard]] PROVBRIDGE_API ValueSet make_set(const ValueVector& elements);

/// @copydoc make_set
[[nodiscard]] PROVBRIDGE_API ValueSet make_set(const std::vector<Value>& elements);

/// Set element together with its identity, in canonical order
struct HashedElement {
    std::size_t hash;
    ValueBox value;
};

/// Elements of a set with their hashes.
/// @return nullopt if any element has no identity
[[nodiscard]] PROVBRIDGE_API std::optional<std::vector<HashedElement>> hashed_elements(const ValueSet& set);

} // namespace provbridge
