// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Property paths: textual addressing of nodes in a value tree.
///
/// A PropertyPath is a sequence of segments, each a string key or a numeric
/// index. The textual form is used as the key of the detailed diff map:
///
/// ```
/// tests[2].nested          // key, index, key
/// tags["kubernetes.io/x"]  // keys that are not identifiers are quoted
/// ```
///
/// Singleton-collapsed collections never contribute an index: the element's
/// fields are addressed directly below the collection's key.
///
/// The key `*` acts as a wildcard in ignore-changes patterns.

#pragma once

#include <provbridge/provbridge_config.h>
#include <provbridge/api.h>
#include <provbridge/errors.h>
#include <provbridge/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <zug/compose.hpp>

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace provbridge {

/// A single path segment: a map key or a list/set index
using PathSegment = std::variant<std::string, std::size_t>;

class PROVBRIDGE_API PropertyPath {
public:
    using value_type = PathSegment;
    using const_iterator = std::vector<PathSegment>::const_iterator;

    PropertyPath() = default;
    PropertyPath(std::initializer_list<PathSegment> init) : segments_(init) {}
    explicit PropertyPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {}

    /// Parse the textual form.
    /// @throws PathParseError on malformed input
    [[nodiscard]] static PropertyPath parse(std::string_view text);

    /// Copy of this path extended by one segment
    [[nodiscard]] PropertyPath key(std::string k) const {
        PropertyPath p = *this;
        p.segments_.emplace_back(std::move(k));
        return p;
    }

    [[nodiscard]] PropertyPath index(std::size_t i) const {
        PropertyPath p = *this;
        p.segments_.emplace_back(i);
        return p;
    }

    void push_back(PathSegment seg) { segments_.push_back(std::move(seg)); }
    void pop_back() { segments_.pop_back(); }

    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] const PathSegment& operator[](std::size_t i) const { return segments_[i]; }
    [[nodiscard]] const PathSegment& front() const { return segments_.front(); }
    [[nodiscard]] const PathSegment& back() const { return segments_.back(); }
    [[nodiscard]] const_iterator begin() const noexcept { return segments_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return segments_.end(); }
    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return segments_; }

    /// First `n` segments
    [[nodiscard]] PropertyPath prefix(std::size_t n) const {
        if (n >= segments_.size()) return *this;
        return PropertyPath{std::vector<PathSegment>(segments_.begin(), segments_.begin() + n)};
    }

    [[nodiscard]] bool starts_with(const PropertyPath& other) const noexcept;

    /// The first segment if it is a key, otherwise nullptr
    [[nodiscard]] const std::string* root_key() const noexcept {
        if (segments_.empty()) return nullptr;
        return std::get_if<std::string>(&segments_.front());
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const PropertyPath&) const = default;
    auto operator<=>(const PropertyPath&) const = default;

private:
    std::vector<PathSegment> segments_;
};

/// @copydoc PropertyPath::parse
[[nodiscard]] inline PropertyPath parse_property_path(std::string_view text)
{
    return PropertyPath::parse(text);
}

/// True for keys written by the bridge itself (`__meta`, `__defaults`)
[[nodiscard]] PROVBRIDGE_API bool is_reserved_key(std::string_view key) noexcept;

/// True if `key` can be written in dotted form
[[nodiscard]] PROVBRIDGE_API bool is_identifier(std::string_view key) noexcept;

// ============================================================
// Direct access
// ============================================================

/// Node at `path`, or null when any segment is missing
[[nodiscard]] PROVBRIDGE_API Value get_at_path(const Value& root, const PropertyPath& path);

/// Copy of `root` with the node at `path` replaced.
/// Missing map keys are created (null nodes become maps); an index equal to
/// the list size appends. Other shape mismatches leave `root` unchanged.
[[nodiscard]] PROVBRIDGE_API Value set_at_path(const Value& root, const PropertyPath& path, Value val);

/// Copy of `root` with the node at `path` removed (map key or list element)
[[nodiscard]] PROVBRIDGE_API Value erase_at_path(const Value& root, const PropertyPath& path);

// ============================================================
// Lenses
// ============================================================

using ValueLens = lager::lens<Value, Value>;

/// Lens focusing the node at `path`; use with lager::view / lager::set / lager::over
[[nodiscard]] PROVBRIDGE_API ValueLens path_lens(const PropertyPath& path);

} // namespace provbridge
