// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_hash.cpp
/// @brief Structural hash, total order and canonical set construction.

#include <provbridge/value_hash.h>

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace provbridge {

namespace {

// Type tags keep e.g. "1" and 1 and [1] apart
enum class HashTag : std::size_t {
    Null = 0x6e756c6c,
    Bool = 0x626f6f6c,
    Number = 0x6e756d62,
    String = 0x73747269,
    List = 0x6c697374,
    Set = 0x73657420,
    Map = 0x6d617020,
};

std::vector<std::pair<std::string, const Value*>> sorted_view(const ValueMap& m)
{
    std::vector<std::pair<std::string, const Value*>> entries;
    entries.reserve(m.size());
    for (const auto& [k, v] : m) {
        entries.emplace_back(k, &v.get());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

std::optional<std::size_t> hash_sequence(HashTag tag, const ValueVector& elems)
{
    std::size_t seed = static_cast<std::size_t>(tag);
    boost::hash_combine(seed, elems.size());
    for (const auto& box : elems) {
        auto h = hash_value(*box);
        if (!h) return std::nullopt;
        boost::hash_combine(seed, *h);
    }
    return seed;
}

std::strong_ordering compare_numbers(double a, double b)
{
    if (a < b) return std::strong_ordering::less;
    if (b < a) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

std::strong_ordering compare_sequences(const ValueVector& a, const ValueVector& b)
{
    const auto n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (auto c = compare_values(*a[i], *b[i]); c != 0) return c;
    }
    return a.size() <=> b.size();
}

ValueVector merge_sequences(const ValueVector& a, const ValueVector& b);

/// `a` with the secret bits of the structurally equal tree `b` added
Value merge_secrets(const Value& a, const Value& b)
{
    Value result = a;
    result.secret = a.secret || b.secret;
    if (const auto* va = a.get_if<ValueVector>()) {
        result.data = merge_sequences(*va, *b.get_if<ValueVector>());
    } else if (const auto* sa = a.get_if<ValueSet>()) {
        // Equal canonical sets hold their elements in the same order
        result.data = ValueSet{merge_sequences(sa->elements, b.get_if<ValueSet>()->elements)};
    } else if (const auto* ma = a.get_if<ValueMap>()) {
        const auto& mb = *b.get_if<ValueMap>();
        auto t = ma->transient();
        for (const auto& [k, v] : *ma) {
            if (const auto* other = mb.find(k)) {
                t.set(k, ValueBox{merge_secrets(*v, **other)});
            }
        }
        result.data = t.persistent();
    }
    return result;
}

ValueVector merge_sequences(const ValueVector& a, const ValueVector& b)
{
    auto t = ValueVector{}.transient();
    for (std::size_t i = 0; i < a.size(); ++i) {
        t.push_back(ValueBox{merge_secrets(*a[i], *b[i])});
    }
    return t.persistent();
}

} // anonymous namespace

std::optional<std::size_t> hash_value(const Value& val)
{
    return std::visit([](const auto& arg) -> std::optional<std::size_t> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return static_cast<std::size_t>(HashTag::Null);
        } else if constexpr (std::is_same_v<T, Unknown>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            std::size_t seed = static_cast<std::size_t>(HashTag::Bool);
            boost::hash_combine(seed, arg);
            return seed;
        } else if constexpr (std::is_same_v<T, double>) {
            std::size_t seed = static_cast<std::size_t>(HashTag::Number);
            // -0.0 == 0.0, so both must hash alike
            boost::hash_combine(seed, arg == 0.0 ? 0.0 : arg);
            return seed;
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::size_t seed = static_cast<std::size_t>(HashTag::String);
            boost::hash_combine(seed, arg);
            return seed;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return hash_sequence(HashTag::List, arg);
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            // Canonical order makes this independent of construction order
            return hash_sequence(HashTag::Set, arg.elements);
        } else {
            std::size_t seed = static_cast<std::size_t>(HashTag::Map);
            boost::hash_combine(seed, arg.size());
            for (const auto& [k, v] : sorted_view(arg)) {
                auto h = hash_value(*v);
                if (!h) return std::nullopt;
                boost::hash_combine(seed, k);
                boost::hash_combine(seed, *h);
            }
            return seed;
        }
    }, val.data);
}

std::strong_ordering compare_values(const Value& a, const Value& b)
{
    if (auto c = a.data.index() <=> b.data.index(); c != 0) {
        return c;
    }
    return std::visit([&](const auto& lhs) -> std::strong_ordering {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, Unknown>) {
            return std::strong_ordering::equal;
        } else if constexpr (std::is_same_v<T, bool>) {
            return lhs <=> rhs;
        } else if constexpr (std::is_same_v<T, double>) {
            return compare_numbers(lhs, rhs);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return lhs.compare(rhs) <=> 0;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return compare_sequences(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            return compare_sequences(lhs.elements, rhs.elements);
        } else {
            const auto l = sorted_view(lhs);
            const auto r = sorted_view(rhs);
            const auto n = std::min(l.size(), r.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (auto c = l[i].first.compare(r[i].first) <=> 0; c != 0) return c;
                if (auto c = compare_values(*l[i].second, *r[i].second); c != 0) return c;
            }
            return l.size() <=> r.size();
        }
    }, a.data);
}

ValueSet make_set(const ValueVector& elements)
{
    std::vector<HashedElement> hashed;
    std::vector<ValueBox> unhashed;
    hashed.reserve(elements.size());

    for (const auto& box : elements) {
        if (auto h = hash_value(*box)) {
            hashed.push_back(HashedElement{*h, box});
        } else {
            unhashed.push_back(box);
        }
    }

    std::sort(hashed.begin(), hashed.end(), [](const HashedElement& a, const HashedElement& b) {
        if (a.hash != b.hash) return a.hash < b.hash;
        return compare_values(*a.value, *b.value) < 0;
    });

    // Duplicates collapse into the first; the survivor is secret if any was
    std::vector<HashedElement> unique;
    unique.reserve(hashed.size());
    for (const auto& e : hashed) {
        if (!unique.empty() && unique.back().hash == e.hash && *unique.back().value == *e.value) {
            if (contains_secret(*e.value)) {
                unique.back().value = ValueBox{merge_secrets(*unique.back().value, *e.value)};
            }
            continue;
        }
        unique.push_back(e);
    }

    auto t = ValueVector{}.transient();
    for (const auto& e : unique) {
        t.push_back(e.value);
    }
    for (const auto& box : unhashed) {
        t.push_back(box);
    }
    return ValueSet{t.persistent()};
}

ValueSet make_set(const std::vector<Value>& elements)
{
    auto t = ValueVector{}.transient();
    for (const auto& v : elements) {
        t.push_back(ValueBox{v});
    }
    return make_set(t.persistent());
}

std::optional<std::vector<HashedElement>> hashed_elements(const ValueSet& set)
{
    std::vector<HashedElement> result;
    result.reserve(set.size());
    for (const auto& box : set.elements) {
        auto h = hash_value(*box);
        if (!h) return std::nullopt;
        result.push_back(HashedElement{*h, box});
    }
    return result;
}

} // namespace provbridge
