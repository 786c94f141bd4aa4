// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file differ.h
/// @brief Detailed diff of two value trees against a schema.
///
/// The differ walks the schema and both trees in lock-step and emits one
/// DiffEntry per changed path:
///
/// - Block fields are diffed independently; a missing field is null
/// - Lists are compared position by position (see list_differ.cpp)
/// - Sets are matched by structural hash (see set_differ.cpp)
/// - Maps are compared key by key
///
/// Unknown and computed values are handled before the structural dispatch
/// (see unknowns.h). The walk never sets replace bits; resolve_replace()
/// does that afterwards.
///
/// Both trees must already be conformed to the schema.
///
/// The differ holds no mutable state; one instance may be used from
/// several threads at once.

#pragma once

#include <provbridge/api.h>
#include <provbridge/diff.h>
#include <provbridge/schema.h>

namespace provbridge {

class PROVBRIDGE_API DetailedDiffer {
public:
    explicit DetailedDiffer(SchemaPtr schema, DiffOptions options = {});

    /// Changed paths between two conformed trees (replace bits unset)
    [[nodiscard]] DiffResult diff(const Value& old_value, const Value& new_value) const;

    [[nodiscard]] const SchemaNode& schema() const noexcept { return *schema_; }
    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }

private:
    /// `schema` is nullptr for undeclared values
    void diff_node(const SchemaNode* schema, const Value& old_value, const Value& new_value,
                   const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const;

    void diff_block(const SchemaNode* schema, const Value& old_value, const Value& new_value,
                    const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const;

    void diff_list(const SchemaNode* schema, const ValueVector& old_elems, const ValueVector& new_elems,
                   const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const;

    void diff_set(const ValueSet& old_set, const ValueSet& new_set,
                  const PropertyPath& path, DiffEntryMap& out) const;

    void diff_map(const SchemaNode* elem_schema, const ValueMap& old_map, const ValueMap& new_map,
                  const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const;

    static void emit(DiffEntryMap& out, const PropertyPath& path, DiffKind kind,
                     const Value& old_value, const Value& new_value);

    SchemaPtr schema_;
    DiffOptions options_;
};

/// Run the differ and the replace resolver
/// @throws TypeMismatchError
[[nodiscard]] PROVBRIDGE_API DiffResult detailed_diff(const SchemaPtr& schema,
                                                      const Value& old_value,
                                                      const Value& new_value,
                                                      const DiffOptions& options = {});

} // namespace provbridge
