// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/unknowns.h>

namespace provbridge {

bool left_to_provider(const SchemaNode* schema, const Value& new_value, bool force_new_governed,
                      const DiffOptions& options) noexcept
{
    if (!options.collapse_computed_absent || !schema || !new_value.is_null()) {
        return false;
    }
    if (!schema->computed || schema->required) {
        return false;
    }
    return !force_new_governed;
}

NodeOutcome classify_node(const SchemaNode* schema, const Value& old_value, const Value& new_value,
                          bool force_new_governed, const DiffOptions& options) noexcept
{
    if (new_value.is_unknown()) {
        return old_value.is_null() ? NodeOutcome::Add : NodeOutcome::Update;
    }
    if (old_value.is_unknown()) {
        return new_value.is_null() ? NodeOutcome::Delete : NodeOutcome::Update;
    }
    if (old_value.is_null()) {
        return NodeOutcome::Add;
    }
    if (new_value.is_null()) {
        if (left_to_provider(schema, new_value, force_new_governed, options)) {
            return NodeOutcome::Suppress;
        }
        return NodeOutcome::Delete;
    }
    return NodeOutcome::Descend;
}

} // namespace provbridge
