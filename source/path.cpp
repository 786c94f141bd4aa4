// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief PropertyPath formatting/parsing and path-addressed access.

#include <provbridge/path.h>
#include <provbridge/value_hash.h>

namespace provbridge {

namespace {

bool is_ident_start(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) noexcept
{
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

class PathParser {
public:
    explicit PathParser(std::string_view text) : text_(text) {}

    PropertyPath parse()
    {
        PropertyPath path;
        if (text_.empty()) {
            return path;
        }
        if (peek() != '[') {
            path.push_back(parse_dotted_key());
        }
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '.') {
                ++pos_;
                path.push_back(parse_dotted_key());
            } else if (c == '[') {
                ++pos_;
                path.push_back(parse_bracket());
            } else {
                fail("expected '.' or '['");
            }
        }
        return path;
    }

private:
    char peek() const noexcept { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    [[noreturn]] void fail(const std::string& reason) const
    {
        throw PathParseError(std::string{text_}, pos_, reason);
    }

    PathSegment parse_dotted_key()
    {
        const auto start = pos_;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '.' || c == '[' || c == ']' || c == '"') break;
            ++pos_;
        }
        if (pos_ == start) {
            fail("empty key");
        }
        return std::string{text_.substr(start, pos_ - start)};
    }

    PathSegment parse_bracket()
    {
        PathSegment seg;
        const char c = peek();
        if (c == '"') {
            ++pos_;
            seg = parse_quoted();
        } else if (c == '*') {
            ++pos_;
            seg = std::string{"*"};
        } else if (is_digit(c)) {
            std::size_t n = 0;
            while (is_digit(peek())) {
                n = n * 10 + static_cast<std::size_t>(text_[pos_] - '0');
                ++pos_;
            }
            seg = n;
        } else {
            fail("expected index, quoted key or '*'");
        }
        if (peek() != ']') {
            fail("expected ']'");
        }
        ++pos_;
        return seg;
    }

    std::string parse_quoted()
    {
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= text_.size()) break;
                const char e = text_[pos_++];
                if (e != '"' && e != '\\') {
                    --pos_;
                    fail("invalid escape");
                }
                out += e;
            } else {
                out += c;
            }
        }
        fail("unterminated quoted key");
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

Value set_impl(const Value& node, const PropertyPath& path, std::size_t depth, Value val)
{
    if (depth == path.size()) {
        return val;
    }
    const auto& seg = path[depth];
    if (auto* key = std::get_if<std::string>(&seg)) {
        if (!node.is_map() && !node.is_null()) {
            detail::log_key_error("set_at_path", *key, "parent is not a map");
            return node;
        }
        Value child = node.at(*key);
        return node.set_key(*key, set_impl(child, path, depth + 1, std::move(val)));
    }

    const auto index = std::get<std::size_t>(seg);
    if (auto* vec = node.get_if<ValueVector>()) {
        Value result;
        if (index < vec->size()) {
            Value child = (*vec)[index].get();
            result = Value{vec->set(index, ValueBox{set_impl(child, path, depth + 1, std::move(val))})};
        } else if (index == vec->size()) {
            result = Value{vec->push_back(ValueBox{set_impl(Value{}, path, depth + 1, std::move(val))})};
        } else {
            detail::log_index_error("set_at_path", index, "out of range");
            return node;
        }
        result.secret = node.secret;
        return result;
    }
    if (auto* set = node.get_if<ValueSet>()) {
        if (index >= set->size()) {
            detail::log_index_error("set_at_path", index, "out of range");
            return node;
        }
        Value child = set->elements[index].get();
        auto elems = set->elements.set(index, ValueBox{set_impl(child, path, depth + 1, std::move(val))});
        Value result{make_set(elems)};
        result.secret = node.secret;
        return result;
    }
    detail::log_index_error("set_at_path", index, "parent is not a list or set");
    return node;
}

Value erase_impl(const Value& node, const PropertyPath& path, std::size_t depth)
{
    const auto& seg = path[depth];
    const bool last = depth + 1 == path.size();

    if (auto* key = std::get_if<std::string>(&seg)) {
        if (!node.contains(*key)) {
            return node;
        }
        if (last) {
            return node.erase_key(*key);
        }
        return node.set_key(*key, erase_impl(node.at(*key), path, depth + 1));
    }

    const auto index = std::get<std::size_t>(seg);
    if (index >= node.size() || !(node.is_list() || node.is_set())) {
        return node;
    }
    const auto elems = node.elements();
    auto t = ValueVector{}.transient();
    for (std::size_t i = 0; i < elems.size(); ++i) {
        if (i != index) {
            t.push_back(elems[i]);
        } else if (!last) {
            t.push_back(ValueBox{erase_impl(*elems[i], path, depth + 1)});
        }
    }
    Value result = node.is_set() ? Value{make_set(t.persistent())} : Value{t.persistent()};
    result.secret = node.secret;
    return result;
}

} // anonymous namespace

PropertyPath PropertyPath::parse(std::string_view text)
{
    return PathParser{text}.parse();
}

bool PropertyPath::starts_with(const PropertyPath& other) const noexcept
{
    if (other.size() > size()) return false;
    for (std::size_t i = 0; i < other.size(); ++i) {
        if (segments_[i] != other.segments_[i]) return false;
    }
    return true;
}

std::string PropertyPath::to_string() const
{
    std::string out;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (auto* key = std::get_if<std::string>(&segments_[i])) {
            if (is_identifier(*key)) {
                if (i > 0) out += '.';
                out += *key;
            } else {
                out += "[\"";
                for (char c : *key) {
                    if (c == '"' || c == '\\') out += '\\';
                    out += c;
                }
                out += "\"]";
            }
        } else {
            out += '[';
            out += std::to_string(std::get<std::size_t>(segments_[i]));
            out += ']';
        }
    }
    return out;
}

bool is_reserved_key(std::string_view key) noexcept
{
    return key == "__meta" || key == "__defaults";
}

bool is_identifier(std::string_view key) noexcept
{
    if (key.empty() || !is_ident_start(key.front())) return false;
    for (char c : key) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

Value get_at_path(const Value& root, const PropertyPath& path)
{
    Value current = root;
    for (const auto& seg : path) {
        if (auto* key = std::get_if<std::string>(&seg)) {
            auto* m = current.get_if<ValueMap>();
            if (!m) return Value{};
            auto* found = m->find(*key);
            if (!found) return Value{};
            current = found->get();
        } else {
            const auto index = std::get<std::size_t>(seg);
            if (!(current.is_list() || current.is_set()) || index >= current.size()) {
                return Value{};
            }
            current = current.at(index);
        }
    }
    return current;
}

Value set_at_path(const Value& root, const PropertyPath& path, Value val)
{
    return set_impl(root, path, 0, std::move(val));
}

Value erase_at_path(const Value& root, const PropertyPath& path)
{
    if (path.empty()) {
        return Value{};
    }
    return erase_impl(root, path, 0);
}

ValueLens path_lens(const PropertyPath& path)
{
    if (path.empty()) {
        return zug::identity;
    }
    return lager::lenses::getset(
        [path](const Value& root) -> Value {
            return get_at_path(root, path);
        },
        [path](Value root, Value new_val) -> Value {
            return set_at_path(root, path, std::move(new_val));
        });
}

} // namespace provbridge
