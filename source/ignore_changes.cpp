// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/ignore_changes.h>
#include <provbridge/errors.h>

#include <set>

namespace provbridge {

namespace {

constexpr std::string_view kWildcard = "*";

Value restore(const PropertyPath& path, std::size_t pos, const Value& src, const Value& dst);

Value restore_key(const PropertyPath& path, std::size_t pos, const std::string& key,
                  const Value& src, const Value& dst)
{
    auto* src_map = src.get_if<ValueMap>();
    auto* dst_map = dst.get_if<ValueMap>();
    if (!src_map || !dst_map) {
        return dst;
    }
    const auto* src_found = src_map->find(key);
    const auto* dst_found = dst_map->find(key);
    const bool last = pos + 1 == path.size();

    if (last && dst_found && !src_found) {
        return dst.erase_key(key);
    }
    if (last && src_found && !dst_found) {
        return dst.set_key(key, src_found->get());
    }
    if (!src_found || !dst_found) {
        return dst;
    }
    return dst.set_key(key, restore(path, pos + 1, src_found->get(), dst_found->get()));
}

Value restore_index(const PropertyPath& path, std::size_t pos, std::size_t index,
                    const Value& src, const Value& dst)
{
    auto* src_vec = src.get_if<ValueVector>();
    auto* dst_vec = dst.get_if<ValueVector>();
    if (!src_vec || !dst_vec || index >= src_vec->size() || index >= dst_vec->size()) {
        return dst;
    }
    Value result{dst_vec->set(index, ValueBox{restore(path, pos + 1, *(*src_vec)[index], *(*dst_vec)[index])})};
    result.secret = dst.secret;
    return result;
}

Value restore(const PropertyPath& path, std::size_t pos, const Value& src, const Value& dst)
{
    if (pos == path.size()) {
        return src;
    }

    const auto& seg = path[pos];
    if (auto* index = std::get_if<std::size_t>(&seg)) {
        return restore_index(path, pos, *index, src, dst);
    }

    const auto& key = std::get<std::string>(seg);
    if (key != kWildcard) {
        return restore_key(path, pos, key, src, dst);
    }

    Value result = dst;
    if (src.is_list() && dst.is_list()) {
        for (std::size_t i = 0; i < src.size(); ++i) {
            result = restore_index(path, pos, i, src, result);
        }
    } else if (src.is_map() && dst.is_map()) {
        std::set<std::string> keys;
        for (const auto& [k, v] : src.as_map()) keys.insert(k);
        for (const auto& [k, v] : dst.as_map()) keys.insert(k);
        for (const auto& k : keys) {
            result = restore_key(path, pos, k, src, result);
        }
    }
    return result;
}

} // anonymous namespace

Value apply_ignore_changes(const Value& old_value, const Value& new_value,
                           const std::vector<std::string>& paths)
{
    std::vector<PropertyPath> parsed;
    std::string errors;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        try {
            parsed.push_back(PropertyPath::parse(paths[i]));
        } catch (const PathParseError& e) {
            if (!errors.empty()) errors += "; ";
            errors += "failed to parse property path " + std::to_string(i) + ": " + e.what();
        }
    }
    if (!errors.empty()) {
        throw PathParseError(errors);
    }
    return apply_ignore_changes(old_value, new_value, parsed);
}

Value apply_ignore_changes(const Value& old_value, const Value& new_value,
                           const std::vector<PropertyPath>& paths)
{
    Value result = new_value;
    for (const auto& path : paths) {
        // An empty path would restore the whole tree
        if (path.empty()) {
            continue;
        }
        result = restore(path, 0, old_value, result);
    }
    return result;
}

} // namespace provbridge
