// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file map_differ.cpp
/// @brief Key-wise diff of string-keyed maps.

#include <provbridge/differ.h>

namespace provbridge {

void DetailedDiffer::diff_map(const SchemaNode* elem_schema, const ValueMap& old_map, const ValueMap& new_map,
                              const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const
{
    for (const auto& [key, old_box] : old_map) {
        if (is_reserved_key(key)) {
            continue;
        }
        const auto* new_found = new_map.find(key);
        const Value new_val = new_found ? new_found->get() : Value{};
        diff_node(elem_schema, *old_box, new_val, path.key(key), force_new_above, out);
    }
    for (const auto& [key, new_box] : new_map) {
        if (is_reserved_key(key) || old_map.count(key) > 0) {
            continue;
        }
        diff_node(elem_schema, Value{}, *new_box, path.key(key), force_new_above, out);
    }
}

} // namespace provbridge
