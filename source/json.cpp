// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json.cpp
/// @brief JSON writer and parser for value trees.

#include <provbridge/json.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>

namespace provbridge {

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level);

void write_sequence(const ValueVector& elems, std::ostringstream& oss, bool compact, int indent_level)
{
    if (elems.empty()) {
        oss << "[]";
        return;
    }
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const char* newline = compact ? "" : "\n";

    oss << "[" << newline;
    bool first = true;
    for (const auto& v : elems) {
        if (!first) oss << "," << newline;
        first = false;
        oss << child_indent;
        to_json_impl(*v, oss, compact, indent_level + 1);
    }
    oss << newline << indent << "]";
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, Unknown>) {
            oss << quote_string(kUnknownSentinel);
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << quote_string(arg);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            write_sequence(arg, oss, compact, indent_level);
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            write_sequence(arg.elements, oss, compact, indent_level);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
                return;
            }
            std::vector<std::string> keys;
            keys.reserve(arg.size());
            for (const auto& [k, v] : arg) {
                keys.push_back(k);
            }
            std::sort(keys.begin(), keys.end());

            const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
            const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
            const char* newline = compact ? "" : "\n";
            const char* space_after_colon = compact ? "" : " ";

            oss << "{" << newline;
            bool first = true;
            for (const auto& k : keys) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent << quote_string(k) << ":" << space_after_colon;
                to_json_impl(arg.find(k)->get(), oss, compact, indent_level + 1);
            }
            oss << newline << indent << "}";
        }
    }, val.data);
}

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json) {}

    Value parse()
    {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("empty JSON input");
        }
        Value result = parse_value(0);
        skip_whitespace();
        if (pos_ != json_.size()) {
            fail("trailing characters");
        }
        return result;
    }

private:
    static constexpr int kMaxDepth = 512;

    std::string_view json_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& reason) const
    {
        throw JsonError(reason, pos_);
    }

    char peek() const
    {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume()
    {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (consume() != c) {
            --pos_;
            fail(std::string("expected '") + c + "'");
        }
    }

    Value parse_value(int depth)
    {
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        fail(std::string("unexpected character '") + c + "'");
    }

    Value parse_object(int depth)
    {
        expect('{');
        skip_whitespace();
        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();
        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value(depth + 1);
            transient.set(std::move(key), ValueBox{std::move(val)});

            skip_whitespace();
            const char c = consume();
            if (c == '}') break;
            if (c != ',') {
                --pos_;
                fail("expected ',' or '}' in object");
            }
        }
        return Value{transient.persistent()};
    }

    Value parse_array(int depth)
    {
        expect('[');
        skip_whitespace();
        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();
        while (true) {
            transient.push_back(ValueBox{parse_value(depth + 1)});
            skip_whitespace();
            const char c = consume();
            if (c == ']') break;
            if (c != ',') {
                --pos_;
                fail("expected ',' or ']' in array");
            }
        }
        return Value{transient.persistent()};
    }

    void append_utf8(std::string& out, unsigned codepoint)
    {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    unsigned parse_hex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("invalid unicode escape");
        }
        unsigned cp = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            fail("invalid unicode escape");
        }
        pos_ += 4;
        return cp;
    }

    std::string parse_string_raw()
    {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            const char c = consume();
            if (c == '"') {
                return result;
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("unexpected end of string escape");
            }
            const char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && json_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        const unsigned low = parse_hex4();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape sequence: \\") + escaped);
            }
        }
        fail("unterminated string");
    }

    Value parse_string()
    {
        std::string s = parse_string_raw();
        if (s == kUnknownSentinel) {
            return Value::unknown();
        }
        return Value{std::move(s)};
    }

    Value parse_number()
    {
        const std::size_t start = pos_;
        if (peek() == '-') consume();
        while (pos_ < json_.size()) {
            const char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' ||
                c == '+' || c == '-') {
                consume();
            } else {
                break;
            }
        }
        double result = 0.0;
        auto [ptr, ec] = std::from_chars(json_.data() + start, json_.data() + pos_, result);
        if (ec != std::errc{} || ptr != json_.data() + pos_) {
            pos_ = start;
            fail("invalid number");
        }
        return Value{result};
    }

    Value parse_bool()
    {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        fail("expected 'true' or 'false'");
    }

    Value parse_null()
    {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("expected 'null'");
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json)
{
    return JsonParser{json}.parse();
}

} // namespace provbridge
