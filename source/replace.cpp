// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file replace.cpp
/// @brief Bottom-up ForceNew resolution.
///
/// An entry replaces when a ForceNew node lies on its path, or when the
/// subtree it adds, deletes or swaps holds a changed ForceNew value.
/// Entries are ordered by path, so all entries below one node form a
/// contiguous range. Each call resolves the range of one schema node and
/// returns whether anything in it replaces; parents OR the results.

#include <provbridge/replace.h>

#include <algorithm>

namespace provbridge {

namespace {

using EntryIter = DiffEntryMap::iterator;

/// Schema of the child reached through `seg`, or nullptr if undeclared
const SchemaNode* child_schema(const SchemaNode* schema, const PathSegment& seg)
{
    if (!schema) return nullptr;
    const SchemaNode* node = schema->collapsed();
    if (!node) return nullptr;

    if (auto* key = std::get_if<std::string>(&seg)) {
        if (node->kind == SchemaKind::Block) return node->field(*key);
        if (node->kind == SchemaKind::Map) return node->elem.get();
        return nullptr;
    }
    if (node->is_collection()) return node->elem.get();
    return nullptr;
}

bool node_forces_new(const SchemaNode* schema)
{
    if (!schema) return false;
    return schema->force_new || (schema->singleton && schema->elem && schema->elem->force_new);
}

/// True if any node in the subtree is ForceNew
bool contains_force_new(const SchemaNode* schema)
{
    if (!schema) return false;
    if (schema->force_new) return true;
    if (contains_force_new(schema->elem.get())) return true;
    for (const auto& [name, field] : schema->fields) {
        if (contains_force_new(field.get())) return true;
    }
    return false;
}

/// True if a ForceNew node below `schema` holds different values in the
/// two subtrees. Used for entries that carry a whole subtree (adds, deletes,
/// set element pairs).
bool subtree_forces_new(const SchemaNode* schema, const Value& old_value, const Value& new_value)
{
    if (!schema || old_value == new_value) return false;
    if (node_forces_new(schema)) return true;

    const SchemaNode* node = schema->collapsed();
    if (!node) return false;

    switch (node->kind) {
    case SchemaKind::Scalar:
        return false;
    case SchemaKind::Set:
        // Set elements have no stable address to compare through
        return contains_force_new(node->elem.get());
    case SchemaKind::List: {
        const auto* old_list = old_value.get_if<ValueVector>();
        const auto* new_list = new_value.get_if<ValueVector>();
        const std::size_t n = std::max(old_list ? old_list->size() : 0, new_list ? new_list->size() : 0);
        for (std::size_t i = 0; i < n; ++i) {
            const Value old_elem = old_list && i < old_list->size() ? (*old_list)[i].get() : Value{};
            const Value new_elem = new_list && i < new_list->size() ? (*new_list)[i].get() : Value{};
            if (subtree_forces_new(node->elem.get(), old_elem, new_elem)) return true;
        }
        return false;
    }
    case SchemaKind::Map:
    case SchemaKind::Block: {
        const auto* old_map = old_value.get_if<ValueMap>();
        const auto* new_map = new_value.get_if<ValueMap>();
        auto check = [&](const std::string& key) {
            const SchemaNode* child = node->kind == SchemaKind::Block ? node->field(key) : node->elem.get();
            const auto* old_found = old_map ? old_map->find(key) : nullptr;
            const auto* new_found = new_map ? new_map->find(key) : nullptr;
            return subtree_forces_new(child,
                                      old_found ? old_found->get() : Value{},
                                      new_found ? new_found->get() : Value{});
        };
        if (old_map) {
            for (const auto& [k, v] : *old_map) {
                if (check(k)) return true;
            }
        }
        if (new_map) {
            for (const auto& [k, v] : *new_map) {
                if (!(old_map && old_map->find(k)) && check(k)) return true;
            }
        }
        return false;
    }
    }
    return false;
}

/// Resolve [first, last): every entry in it has a path of at least `depth` segments
bool resolve_range(const SchemaNode* schema, std::size_t depth, bool governed,
                   EntryIter first, EntryIter last)
{
    governed = governed || node_forces_new(schema);
    bool any = false;

    auto it = first;
    // The entry for this node itself sorts first
    if (it != last && it->first.size() == depth) {
        DiffEntry& entry = it->second;
        entry.replace = governed || subtree_forces_new(schema, entry.old_value, entry.new_value);
        any = any || entry.replace;
        ++it;
    }

    while (it != last) {
        const PathSegment& seg = it->first[depth];
        auto group_end = it;
        while (group_end != last && group_end->first[depth] == seg) {
            ++group_end;
        }
        any = resolve_range(child_schema(schema, seg), depth + 1, governed, it, group_end) || any;
        it = group_end;
    }
    return any;
}

} // anonymous namespace

void resolve_replace(const SchemaNode& schema, DiffResult& result)
{
    result.replace = resolve_range(&schema, 0, false, result.entries.begin(), result.entries.end());
}

void clear_replace(DiffResult& result)
{
    for (auto& [path, entry] : result.entries) {
        entry.replace = false;
    }
    result.replace = false;
}

void apply_replace_override(DiffResult& result, std::optional<bool> replace_override)
{
    if (!replace_override) {
        return;
    }
    if (*replace_override) {
        bool any = false;
        for (const auto& [path, entry] : result.entries) {
            any = any || entry.replace;
        }
        if (!any) {
            DiffEntry meta;
            meta.path = kMetaPath;
            meta.kind = DiffKind::Update;
            meta.replace = true;
            result.entries.insert_or_assign(kMetaPath, std::move(meta));
        }
        result.replace = true;
        return;
    }
    clear_replace(result);
}

} // namespace provbridge
