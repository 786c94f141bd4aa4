// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Diff entries, results and per-call diff options.

#pragma once

#include <provbridge/api.h>
#include <provbridge/path.h>
#include <provbridge/value.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provbridge {

enum class DiffKind {
    Add,
    Delete,
    Update,
};

/// Wire classification of a changed property
enum class PropertyDiffKind {
    Add,
    AddReplace,
    Delete,
    DeleteReplace,
    Update,
    UpdateReplace,
};

/// One changed path.
/// The old/new values are the subtrees at `path` (null when absent); set
/// entries at synthetic indices carry the paired elements.
struct DiffEntry {
    PropertyPath path;
    DiffKind kind = DiffKind::Update;
    bool replace = false;
    bool secret = false;
    Value old_value;
    Value new_value;
};

using DiffEntryMap = std::map<PropertyPath, DiffEntry>;

struct DiffResult {
    DiffEntryMap entries;  ///< keyed (and ordered) by path
    bool replace = false;  ///< OR of every entry's replace bit

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }

    [[nodiscard]] const DiffEntry* find(const PropertyPath& path) const {
        auto it = entries.find(path);
        return it == entries.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const DiffEntry* find(std::string_view path) const {
        return find(PropertyPath::parse(path));
    }
};

struct DiffOptions {
    /// true forces a replace, false demotes every replace
    std::optional<bool> replace_override;

    /// Paths whose changes are ignored; `*` matches any key or index
    std::vector<std::string> ignore_changes;

    /// Computed, non-required values absent from the new inputs are left to the provider
    bool collapse_computed_absent = true;
};

[[nodiscard]] PROVBRIDGE_API PropertyDiffKind wire_kind(const DiffEntry& entry) noexcept;

[[nodiscard]] PROVBRIDGE_API std::string_view to_string(DiffKind kind) noexcept;

/// ADD, ADD_REPLACE, DELETE, DELETE_REPLACE, UPDATE, UPDATE_REPLACE
[[nodiscard]] PROVBRIDGE_API std::string_view to_string(PropertyDiffKind kind) noexcept;

} // namespace provbridge
