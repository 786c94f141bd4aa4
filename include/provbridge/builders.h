// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of value trees.
///
/// - ObjectBuilder / MapBuilder: build a map payload
/// - ListBuilder: build a list payload
/// - SetBuilder: build a canonical set payload (duplicates collapse)
///
/// Usage:
/// @code
///   #include <provbridge/builders.h>
///
///   Value inputs = ObjectBuilder()
///       .set("name", "web")
///       .set("ports", ListBuilder().push_back(80).push_back(443).finish())
///       .set("tags", SetBuilder().insert("a").insert("b").finish())
///       .finish();
/// @endcode

#pragma once

#include <provbridge/value.h>
#include <provbridge/value_hash.h>

namespace provbridge {

/// Builder for map/object payloads
class ObjectBuilder {
public:
    using transient_type = ValueMap::transient_type;

    ObjectBuilder() : transient_(ValueMap{}.transient()) {}
    explicit ObjectBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    /// Start from an existing object (a non-object starts empty)
    explicit ObjectBuilder(const Value& existing)
        : transient_(existing.is_map() ? existing.get_if<ValueMap>()->transient()
                                       : ValueMap{}.transient()) {}

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // transient sharing is unsafe
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    template <typename T>
    ObjectBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    ObjectBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    ObjectBuilder& erase(const std::string& key) {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value get(const std::string& key) const {
        if (auto* found = transient_.find(key)) {
            return found->get();
        }
        return Value{};
    }

    /// Finish building and return the Value.
    /// The builder should not be used afterwards.
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Map payloads share the object representation
using MapBuilder = ObjectBuilder;

/// Builder for list payloads
class ListBuilder {
public:
    using transient_type = ValueVector::transient_type;

    ListBuilder() : transient_(ValueVector{}.transient()) {}
    explicit ListBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    ListBuilder(ListBuilder&&) noexcept = default;
    ListBuilder& operator=(ListBuilder&&) noexcept = default;
    ListBuilder(const ListBuilder&) = delete;
    ListBuilder& operator=(const ListBuilder&) = delete;

    template <typename T>
    ListBuilder& push_back(T&& val) {
        transient_.push_back(ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    ListBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for set payloads.
/// Elements are collected in insertion order and canonicalised by finish().
class SetBuilder {
public:
    SetBuilder() : transient_(ValueVector{}.transient()) {}

    SetBuilder(SetBuilder&&) noexcept = default;
    SetBuilder& operator=(SetBuilder&&) noexcept = default;
    SetBuilder(const SetBuilder&) = delete;
    SetBuilder& operator=(const SetBuilder&) = delete;

    template <typename T>
    SetBuilder& insert(T&& val) {
        transient_.push_back(ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    SetBuilder& insert(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] Value finish() {
        return Value{make_set(transient_.persistent())};
    }

private:
    ValueVector::transient_type transient_;
};

} // namespace provbridge
