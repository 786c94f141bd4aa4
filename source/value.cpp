// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.cpp
/// @brief Value utilities: rendering, predicates and secret stripping.

#include <provbridge/value.h>
#include <provbridge/value_hash.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <vector>

namespace provbridge {

namespace {

/// Map entries sorted by key (immer::map iterates in hash order)
std::vector<std::pair<std::string, ValueBox>> sorted_entries(const ValueMap& m)
{
    std::vector<std::pair<std::string, ValueBox>> entries;
    entries.reserve(m.size());
    for (const auto& [k, v] : m) {
        entries.emplace_back(k, v);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

void render(const Value& val, std::string& out)
{
    if (val.secret) {
        out += "[secret]";
        return;
    }
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, Unknown>) {
            out += "[unknown]";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            out += format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += quote_string(arg);
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueSet>) {
            const ValueVector* elems = nullptr;
            if constexpr (std::is_same_v<T, ValueSet>) {
                elems = &arg.elements;
            } else {
                elems = &arg;
            }
            out += '[';
            bool first = true;
            for (const auto& box : *elems) {
                if (!first) out += ", ";
                first = false;
                render(*box, out);
            }
            out += ']';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            out += '{';
            bool first = true;
            for (const auto& [k, v] : sorted_entries(arg)) {
                if (!first) out += ", ";
                first = false;
                out += quote_string(k);
                out += ": ";
                render(*v, out);
            }
            out += '}';
        }
    }, val.data);
}

} // anonymous namespace

Value Value::set(std::initializer_list<Value> init)
{
    return Value{make_set(std::vector<Value>(init))};
}

std::string_view type_name(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "null";
        else if constexpr (std::is_same_v<T, Unknown>) return "unknown";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, ValueVector>) return "list";
        else if constexpr (std::is_same_v<T, ValueSet>) return "set";
        else return "map";
    }, val.data);
}

std::string format_number(double v)
{
    if (std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc{}) {
        return std::to_string(v);
    }
    return std::string(buf.data(), ptr);
}

std::string quote_string(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                    out += esc;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string value_to_string(const Value& val)
{
    std::string out;
    render(val, out);
    return out;
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (val.secret) {
        std::cout << indent << prefix << "[secret]\n";
        return;
    }
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [k, v] : sorted_entries(*m)) {
            std::cout << indent << prefix << k << ":\n";
            print_value(*v, "", depth + 1);
        }
        return;
    }
    if (val.is_list() || val.is_set()) {
        const char open = val.is_set() ? '<' : '[';
        const char close = val.is_set() ? '>' : ']';
        const auto elems = val.elements();
        for (std::size_t i = 0; i < elems.size(); ++i) {
            std::cout << indent << prefix << open << i << close << ":\n";
            print_value(*elems[i], "", depth + 1);
        }
        return;
    }
    std::cout << indent << prefix << value_to_string(val) << "\n";
}

bool contains_unknown(const Value& val)
{
    if (val.is_unknown()) return true;
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [k, v] : *m) {
            if (contains_unknown(*v)) return true;
        }
        return false;
    }
    if (val.is_list() || val.is_set()) {
        for (const auto& box : val.elements()) {
            if (contains_unknown(*box)) return true;
        }
    }
    return false;
}

bool contains_secret(const Value& val)
{
    if (val.secret) return true;
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [k, v] : *m) {
            if (contains_secret(*v)) return true;
        }
        return false;
    }
    if (val.is_list() || val.is_set()) {
        for (const auto& box : val.elements()) {
            if (contains_secret(*box)) return true;
        }
    }
    return false;
}

Value strip_secrets(const Value& val)
{
    if (!contains_secret(val)) {
        return val;
    }
    Value result = std::visit([](const auto& arg) -> Value {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ValueMap>) {
            auto t = ValueMap{}.transient();
            for (const auto& [k, v] : arg) {
                t.set(k, ValueBox{strip_secrets(*v)});
            }
            return Value{t.persistent()};
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            auto t = ValueVector{}.transient();
            for (const auto& box : arg) {
                t.push_back(ValueBox{strip_secrets(*box)});
            }
            return Value{t.persistent()};
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            // Canonical order does not depend on the secret bit
            auto t = ValueVector{}.transient();
            for (const auto& box : arg.elements) {
                t.push_back(ValueBox{strip_secrets(*box)});
            }
            return Value{ValueSet{t.persistent()}};
        } else {
            return Value{arg};
        }
    }, val.data);
    result.secret = false;
    return result;
}

} // namespace provbridge
