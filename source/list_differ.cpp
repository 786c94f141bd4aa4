// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file list_differ.cpp
/// @brief Positional diff of ordered collections.
///
/// Not an edit-distance diff: an insertion in the middle shows up as a run
/// of positional updates followed by an Add at the end.

#include <provbridge/differ.h>

#include <algorithm>

namespace provbridge {

void DetailedDiffer::diff_list(const SchemaNode* elem_schema, const ValueVector& old_elems,
                               const ValueVector& new_elems, const PropertyPath& path,
                               bool force_new_above, DiffEntryMap& out) const
{
    const std::size_t overlap = std::min(old_elems.size(), new_elems.size());

    // Trim the equal leading and trailing runs of the overlapping window
    std::size_t begin = 0;
    while (begin < overlap && *old_elems[begin] == *new_elems[begin]) {
        ++begin;
    }
    std::size_t end = overlap;
    while (end > begin && *old_elems[end - 1] == *new_elems[end - 1]) {
        --end;
    }

    for (std::size_t i = begin; i < end; ++i) {
        diff_node(elem_schema, *old_elems[i], *new_elems[i], path.index(i), force_new_above, out);
    }

    for (std::size_t i = overlap; i < new_elems.size(); ++i) {
        diff_node(elem_schema, Value{}, *new_elems[i], path.index(i), force_new_above, out);
    }
    for (std::size_t i = overlap; i < old_elems.size(); ++i) {
        diff_node(elem_schema, *old_elems[i], Value{}, path.index(i), force_new_above, out);
    }
}

} // namespace provbridge
