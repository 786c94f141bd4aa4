// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value tree type for resource inputs and state.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Unknown (not known until the resource is applied)
/// - Known scalar: bool, number (double), string
/// - Known collection: list, set, map/object (using immer's immutable containers)
///
/// Every node additionally carries a `secret` bit. Equality and hashing
/// ignore it; the secret propagator and the state codec read it.

#pragma once

#include <provbridge/provbridge_config.h>
#include <provbridge/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace provbridge {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROVBRIDGE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROVBRIDGE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROVBRIDGE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

struct Value;

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::vector<ValueBox>;

/// A value that will only be known after the resource is applied
struct Unknown {
    bool operator==(const Unknown&) const = default;
};

/// Set payload.
///
/// Elements are unique by content and kept in canonical order (ascending
/// structural hash, ties broken by compare_values). Elements containing an
/// Unknown have no identity: they follow the hashed ones in insertion order
/// and are never deduplicated. Build sets through make_set() or SetBuilder.
struct ValueSet {
    ValueVector elements;

    [[nodiscard]] std::size_t size() const noexcept { return elements.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements.empty(); }

    bool operator==(const ValueSet& other) const { return elements == other.elements; }
};

struct PROVBRIDGE_API Value
{
    std::variant<std::monostate,
                 Unknown,
                 bool,
                 double,
                 std::string,
                 ValueVector,
                 ValueSet,
                 ValueMap>
        data;

    bool secret = false;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::monostate) noexcept : data(std::monostate{}) {}
    Value(Unknown) noexcept : data(Unknown{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueSet v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}

    // Factory functions
    static Value unknown() { return Value{Unknown{}}; }

    static Value list(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value object(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    /// Map payloads share the representation of objects; the schema decides
    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        return object(init);
    }

    /// Build a set; duplicates collapse (see ValueSet)
    static Value set(std::initializer_list<Value> init);

    /// Copy of `v` with the secret bit set
    static Value make_secret(Value v) {
        v.secret = true;
        return v;
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_unknown() const noexcept { return std::holds_alternative<Unknown>(data); }
    [[nodiscard]] bool is_known() const noexcept { return !is_null() && !is_unknown(); }
    [[nodiscard]] bool is_list() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_set() const noexcept { return is<ValueSet>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_scalar() const noexcept { return is<bool>() || is<double>() || is<std::string>(); }

    [[nodiscard]] Value at(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return Value{};
    }

    [[nodiscard]] Value at(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        if (auto* s = get_if<ValueSet>()) {
            if (index < s->size()) return s->elements[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return Value{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        if (auto* s = get_if<ValueSet>()) return s->size();
        return 0;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueMap as_map(ValueMap default_val = {}) const {
        if (auto* p = get_if<ValueMap>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueVector as_vector(ValueVector default_val = {}) const {
        if (auto* p = get_if<ValueVector>()) return *p;
        return default_val;
    }

    /// Elements of a list or set, in order
    [[nodiscard]] ValueVector elements() const {
        if (auto* p = get_if<ValueVector>()) return *p;
        if (auto* s = get_if<ValueSet>()) return s->elements;
        return {};
    }

    [[nodiscard]] Value set_key(const std::string& key, Value val) const {
        if (auto* m = get_if<ValueMap>()) return with_payload(m->set(key, ValueBox{std::move(val)}));
        if (is_null()) return with_payload(ValueMap{}.set(key, ValueBox{std::move(val)}));
        detail::log_key_error("Value::set_key", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] Value erase_key(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return with_payload(m->erase(key));
        return *this;
    }

    [[nodiscard]] Value with_secret(bool s) const {
        Value copy = *this;
        copy.secret = s;
        return copy;
    }

private:
    template <typename Payload>
    [[nodiscard]] Value with_payload(Payload p) const {
        Value result{std::move(p)};
        result.secret = secret;
        return result;
    }
};

/// Structural equality. The secret bit does not take part.
inline bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Name of the value's kind: null, unknown, bool, number, string, list, set, map
[[nodiscard]] PROVBRIDGE_API std::string_view type_name(const Value& val);

/// Compact one-line rendering, e.g. {"a": [1, "x"]}. Secret nodes render as [secret].
[[nodiscard]] PROVBRIDGE_API std::string value_to_string(const Value& val);

/// Print Value with indentation (debugging aid)
PROVBRIDGE_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Shortest round-trip decimal form; integral values print without a fraction
[[nodiscard]] PROVBRIDGE_API std::string format_number(double v);

/// JSON string literal for `s`, including the surrounding quotes
[[nodiscard]] PROVBRIDGE_API std::string quote_string(std::string_view s);

/// True if an Unknown occurs anywhere in the tree
[[nodiscard]] PROVBRIDGE_API bool contains_unknown(const Value& val);

/// True if any node in the tree has the secret bit
[[nodiscard]] PROVBRIDGE_API bool contains_secret(const Value& val);

/// Copy of the tree with every secret bit cleared
[[nodiscard]] PROVBRIDGE_API Value strip_secrets(const Value& val);

} // namespace provbridge
