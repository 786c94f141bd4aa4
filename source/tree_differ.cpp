// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_differ.cpp
/// @brief Recursive dispatch of the detailed diff over schema and value trees.

#include <provbridge/differ.h>
#include <provbridge/replace.h>
#include <provbridge/unknowns.h>

#include <set>

namespace provbridge {

namespace {

bool governs_force_new(const SchemaNode* schema) noexcept
{
    if (!schema) return false;
    if (schema->force_new) return true;
    return schema->singleton && schema->elem && schema->elem->force_new;
}

/// A missing root is diffed as an empty object so every field gets its own entry
Value root_or_empty(const SchemaNode& schema, const Value& root)
{
    if (root.is_null() && schema.kind == SchemaKind::Block) {
        return Value{ValueMap{}};
    }
    return root;
}

} // anonymous namespace

DetailedDiffer::DetailedDiffer(SchemaPtr schema, DiffOptions options)
    : schema_(std::move(schema))
    , options_(std::move(options))
{
    if (!schema_) {
        throw SchemaError("DetailedDiffer requires a schema");
    }
}

DiffResult DetailedDiffer::diff(const Value& old_value, const Value& new_value) const
{
    DiffResult result;
    diff_node(schema_.get(),
              root_or_empty(*schema_, old_value),
              root_or_empty(*schema_, new_value),
              PropertyPath{}, false, result.entries);
    return result;
}

void DetailedDiffer::emit(DiffEntryMap& out, const PropertyPath& path, DiffKind kind,
                          const Value& old_value, const Value& new_value)
{
    DiffEntry entry;
    entry.path = path;
    entry.kind = kind;
    entry.old_value = old_value;
    entry.new_value = new_value;
    out.insert_or_assign(path, std::move(entry));
}

void DetailedDiffer::diff_node(const SchemaNode* schema, const Value& old_value, const Value& new_value,
                               const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const
{
    if (old_value == new_value) {
        return;
    }

    const bool governed = force_new_above || governs_force_new(schema);

    switch (classify_node(schema, old_value, new_value, governed, options_)) {
        case NodeOutcome::Suppress:
            return;
        case NodeOutcome::Add:
            emit(out, path, DiffKind::Add, old_value, new_value);
            return;
        case NodeOutcome::Delete:
            emit(out, path, DiffKind::Delete, old_value, new_value);
            return;
        case NodeOutcome::Update:
            emit(out, path, DiffKind::Update, old_value, new_value);
            return;
        case NodeOutcome::Descend:
            break;
    }

    // Singleton collections were collapsed by conform(); diff the element
    const SchemaNode* node = schema ? schema->collapsed() : nullptr;
    const SchemaKind kind = node ? node->kind : SchemaKind::Scalar;

    const auto* old_map = old_value.get_if<ValueMap>();
    const auto* new_map = new_value.get_if<ValueMap>();
    const auto* old_list = old_value.get_if<ValueVector>();
    const auto* new_list = new_value.get_if<ValueVector>();
    const auto* old_set = old_value.get_if<ValueSet>();
    const auto* new_set = new_value.get_if<ValueSet>();

    if (!node) {
        // Undeclared: follow the values' own shape
        if (old_map && new_map) {
            diff_map(nullptr, *old_map, *new_map, path, governed, out);
        } else if (old_list && new_list) {
            diff_list(nullptr, *old_list, *new_list, path, governed, out);
        } else if (old_set && new_set) {
            diff_set(*old_set, *new_set, path, out);
        } else {
            emit(out, path, DiffKind::Update, old_value, new_value);
        }
        return;
    }

    switch (kind) {
        case SchemaKind::Block:
            if (old_map && new_map) {
                diff_block(node, old_value, new_value, path, governed, out);
                return;
            }
            break;
        case SchemaKind::List:
            if (old_list && new_list) {
                diff_list(node->elem.get(), *old_list, *new_list, path, governed, out);
                return;
            }
            break;
        case SchemaKind::Set:
            if (old_set && new_set) {
                diff_set(*old_set, *new_set, path, out);
                return;
            }
            break;
        case SchemaKind::Map:
            if (old_map && new_map) {
                diff_map(node->elem.get(), *old_map, *new_map, path, governed, out);
                return;
            }
            break;
        case SchemaKind::Scalar:
            break;
    }
    emit(out, path, DiffKind::Update, old_value, new_value);
}

void DetailedDiffer::diff_block(const SchemaNode* schema, const Value& old_value, const Value& new_value,
                                const PropertyPath& path, bool force_new_above, DiffEntryMap& out) const
{
    const auto& old_map = *old_value.get_if<ValueMap>();
    const auto& new_map = *new_value.get_if<ValueMap>();

    std::set<std::string> keys;
    for (const auto& [k, v] : old_map) keys.insert(k);
    for (const auto& [k, v] : new_map) keys.insert(k);

    for (const auto& key : keys) {
        if (is_reserved_key(key)) {
            continue;
        }
        const auto* old_found = old_map.find(key);
        const auto* new_found = new_map.find(key);
        const Value old_field = old_found ? old_found->get() : Value{};
        const Value new_field = new_found ? new_found->get() : Value{};
        diff_node(schema->field(key), old_field, new_field, path.key(key), force_new_above, out);
    }
}

DiffResult detailed_diff(const SchemaPtr& schema, const Value& old_value, const Value& new_value,
                         const DiffOptions& options)
{
    DetailedDiffer differ{schema, options};
    DiffResult result = differ.diff(old_value, new_value);
    resolve_replace(*schema, result);
    if (old_value.is_null()) {
        clear_replace(result);
    }
    apply_replace_override(result, options.replace_override);
    return result;
}

} // namespace provbridge
