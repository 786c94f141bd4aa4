// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/diff.h>

namespace provbridge {

PropertyDiffKind wire_kind(const DiffEntry& entry) noexcept
{
    switch (entry.kind) {
        case DiffKind::Add:
            return entry.replace ? PropertyDiffKind::AddReplace : PropertyDiffKind::Add;
        case DiffKind::Delete:
            return entry.replace ? PropertyDiffKind::DeleteReplace : PropertyDiffKind::Delete;
        case DiffKind::Update:
            break;
    }
    return entry.replace ? PropertyDiffKind::UpdateReplace : PropertyDiffKind::Update;
}

std::string_view to_string(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::Add: return "add";
        case DiffKind::Delete: return "delete";
        case DiffKind::Update: return "update";
    }
    return "update";
}

std::string_view to_string(PropertyDiffKind kind) noexcept
{
    switch (kind) {
        case PropertyDiffKind::Add: return "ADD";
        case PropertyDiffKind::AddReplace: return "ADD_REPLACE";
        case PropertyDiffKind::Delete: return "DELETE";
        case PropertyDiffKind::DeleteReplace: return "DELETE_REPLACE";
        case PropertyDiffKind::Update: return "UPDATE";
        case PropertyDiffKind::UpdateReplace: return "UPDATE_REPLACE";
    }
    return "UPDATE";
}

} // namespace provbridge
