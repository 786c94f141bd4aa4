// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render.cpp
/// @brief Wire diff and preview rendering.

#include <provbridge/render.h>
#include <provbridge/builders.h>
#include <provbridge/json.h>
#include <provbridge/replace.h>

#include <algorithm>
#include <set>

namespace provbridge {

namespace {

constexpr std::size_t kIndentWidth = 4;

std::string segment_label(const PathSegment& seg)
{
    if (auto* key = std::get_if<std::string>(&seg)) {
        return is_identifier(*key) ? *key : quote_string(*key);
    }
    return "[" + std::to_string(std::get<std::size_t>(seg)) + "]";
}

std::string_view entry_marker(DiffKind kind)
{
    switch (kind) {
        case DiffKind::Add: return "+";
        case DiffKind::Delete: return "-";
        case DiffKind::Update: break;
    }
    return "~";
}

std::string_view op_marker(ResourceOp op)
{
    switch (op) {
        case ResourceOp::Same: return " ";
        case ResourceOp::Create: return "+";
        case ResourceOp::Update: return "~";
        case ResourceOp::Replace: return "+-";
        case ResourceOp::Delete: return "-";
    }
    return " ";
}

std::string show(const DiffEntry& entry, const Value& v)
{
    if (entry.secret) {
        return "[secret]";
    }
    return value_to_string(v);
}

std::string leaf_line(const DiffEntry& entry)
{
    std::string line{entry_marker(entry.kind)};
    line += ' ';
    line += entry.path.empty() ? std::string{"<resource>"} : segment_label(entry.path.back());

    if (entry.path != kMetaPath) {
        line += ": ";
        switch (entry.kind) {
            case DiffKind::Add:
                line += show(entry, entry.new_value);
                break;
            case DiffKind::Delete:
                line += show(entry, entry.old_value);
                break;
            case DiffKind::Update:
                line += show(entry, entry.old_value);
                line += " => ";
                line += show(entry, entry.new_value);
                break;
        }
    }
    if (entry.replace) {
        line += " [forces replacement]";
    }
    return line;
}

} // anonymous namespace

WireDiff to_wire(const DiffResult& result)
{
    WireDiff wire;
    wire.changes = result.empty() ? DiffChanges::None : DiffChanges::Some;

    std::set<std::string> diffs;
    std::set<std::string> replaces;
    for (const auto& [path, entry] : result.entries) {
        wire.detailed_diff[path.to_string()] = wire_kind(entry);
        if (const std::string* top = path.root_key()) {
            diffs.insert(*top);
            if (entry.replace) {
                replaces.insert(*top);
            }
        }
    }
    wire.diffs.assign(diffs.begin(), diffs.end());
    wire.replaces.assign(replaces.begin(), replaces.end());
    return wire;
}

std::string wire_to_json(const WireDiff& wire)
{
    ObjectBuilder detailed;
    for (const auto& [path, kind] : wire.detailed_diff) {
        if (kind == PropertyDiffKind::Add) {
            detailed.set(path, Value{ValueMap{}});
        } else {
            detailed.set(path, ObjectBuilder().set("kind", std::string{to_string(kind)}).finish());
        }
    }

    ListBuilder replaces;
    for (const auto& r : wire.replaces) {
        replaces.push_back(r);
    }
    ListBuilder diffs;
    for (const auto& d : wire.diffs) {
        diffs.push_back(d);
    }

    Value body = ObjectBuilder()
        .set("changes", std::string{wire.changes == DiffChanges::Some ? "DIFF_SOME" : "DIFF_NONE"})
        .set("replaces", replaces.finish())
        .set("diffs", diffs.finish())
        .set("detailedDiff", detailed.finish())
        .set("hasDetailedDiff", wire.has_detailed_diff)
        .finish();
    return to_json(body, true);
}

ResourceOp resource_op(const Value& old_value, const Value& new_value, const DiffResult& result)
{
    if (old_value.is_null() && !new_value.is_null()) {
        return ResourceOp::Create;
    }
    if (new_value.is_null() && !old_value.is_null()) {
        return ResourceOp::Delete;
    }
    if (result.empty()) {
        return ResourceOp::Same;
    }
    return result.replace ? ResourceOp::Replace : ResourceOp::Update;
}

std::string_view to_string(ResourceOp op) noexcept
{
    switch (op) {
        case ResourceOp::Same: return "same";
        case ResourceOp::Create: return "create";
        case ResourceOp::Update: return "update";
        case ResourceOp::Replace: return "replace";
        case ResourceOp::Delete: return "delete";
    }
    return "same";
}

std::string render_preview(std::string_view type, std::string_view name, ResourceOp op,
                           const DiffResult& result)
{
    std::string out;
    out += op_marker(op);
    out += ' ';
    out += type;
    out += ": ";
    out += name;
    out += " (";
    out += to_string(op);
    out += ")\n";

    const PropertyPath* prev = nullptr;
    for (const auto& [path, entry] : result.entries) {
        // Interior lines already printed for the previous entry are shared
        std::size_t common = 0;
        if (prev && !path.empty() && !prev->empty()) {
            const std::size_t limit = std::min(prev->size(), path.size()) - 1;
            while (common < limit && (*prev)[common] == path[common]) {
                ++common;
            }
        }
        for (std::size_t depth = common; depth + 1 < path.size(); ++depth) {
            out += std::string((depth + 1) * kIndentWidth, ' ');
            out += "~ ";
            out += segment_label(path[depth]);
            out += ":\n";
        }
        out += std::string(std::max<std::size_t>(path.size(), 1) * kIndentWidth, ' ');
        out += leaf_line(entry);
        out += '\n';
        prev = &path;
    }
    return out;
}

} // namespace provbridge
