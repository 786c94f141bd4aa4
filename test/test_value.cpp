// test_value.cpp - Tests for the value model
// Value kinds, secret marks, structural hashing and canonical sets

#include <catch2/catch_all.hpp>
#include <provbridge/builders.h>
#include <provbridge/value.h>
#include <provbridge/value_hash.h>

#include <compare>
#include <string>

using namespace provbridge;

// ============================================================
// Construction and accessors
// ============================================================

TEST_CASE("Value construction", "[value][basic]") {
    SECTION("null by default") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE_FALSE(v.is_known());
        REQUIRE(type_name(v) == "null");
    }

    SECTION("scalars") {
        REQUIRE(Value{true}.as_bool());
        REQUIRE(Value{42}.as_number() == 42.0);
        REQUIRE(Value{"abc"}.as_string() == "abc");
        REQUIRE(type_name(Value{1.5}) == "number");
        REQUIRE(Value{"x"}.is_scalar());
    }

    SECTION("unknown") {
        Value v = Value::unknown();
        REQUIRE(v.is_unknown());
        REQUIRE_FALSE(v.is_known());
        REQUIRE(type_name(v) == "unknown");
    }

    SECTION("object access") {
        Value obj = Value::object({{"name", "web"}, {"count", 3}});
        REQUIRE(obj.is_map());
        REQUIRE(obj.size() == 2);
        REQUIRE(obj.contains("name"));
        REQUIRE(obj.at("name").as_string() == "web");
        REQUIRE(obj.at("missing").is_null());
    }

    SECTION("list access") {
        Value list = Value::list({1, 2, 3});
        REQUIRE(list.is_list());
        REQUIRE(list.at(std::size_t{1}).as_number() == 2.0);
        REQUIRE(list.at(std::size_t{9}).is_null());
    }
}

TEST_CASE("Value persistent edits", "[value][edit]") {
    Value base = Value::object({{"a", 1}});

    Value added = base.set_key("b", 2);
    REQUIRE(added.size() == 2);
    REQUIRE(base.size() == 1);

    Value erased = added.erase_key("a");
    REQUIRE(erased.size() == 1);
    REQUIRE_FALSE(erased.contains("a"));

    SECTION("set_key on null creates an object") {
        Value v = Value{}.set_key("k", "v");
        REQUIRE(v.is_map());
        REQUIRE(v.at("k").as_string() == "v");
    }

    SECTION("edits keep the secret mark") {
        Value secret = Value::make_secret(base);
        REQUIRE(secret.set_key("c", 3).secret);
    }
}

// ============================================================
// Secrets
// ============================================================

TEST_CASE("Secret marks do not affect equality", "[value][secret]") {
    Value plain{"hunter2"};
    Value secret = Value::make_secret(plain);

    REQUIRE(secret.secret);
    REQUIRE(plain == secret);
    REQUIRE(value_to_string(secret) == "[secret]");
}

TEST_CASE("contains_secret and strip_secrets", "[value][secret]") {
    Value tree = Value::object({
        {"user", "admin"},
        {"auth", Value::object({{"password", Value::make_secret(Value{"pw"})}})},
    });

    REQUIRE(contains_secret(tree));
    REQUIRE_FALSE(contains_secret(Value::object({{"user", "admin"}})));

    Value stripped = strip_secrets(tree);
    REQUIRE_FALSE(contains_secret(stripped));
    REQUIRE(stripped == tree);
}

TEST_CASE("contains_unknown", "[value][unknown]") {
    REQUIRE(contains_unknown(Value::list({1, Value::unknown()})));
    REQUIRE(contains_unknown(Value::object({{"x", Value::object({{"y", Value::unknown()}})}})));
    REQUIRE_FALSE(contains_unknown(Value::list({1, 2})));
}

// ============================================================
// Rendering
// ============================================================

TEST_CASE("value_to_string", "[value][render]") {
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value::unknown()) == "[unknown]");
    REQUIRE(value_to_string(Value{true}) == "true");
    REQUIRE(value_to_string(Value{3}) == "3");
    REQUIRE(value_to_string(Value{2.5}) == "2.5");
    REQUIRE(value_to_string(Value{"a\"b"}) == "\"a\\\"b\"");
    REQUIRE(value_to_string(Value::list({1, "x"})) == "[1, \"x\"]");

    // Keys are rendered in sorted order
    Value obj = Value::object({{"z", 1}, {"a", 2}});
    REQUIRE(value_to_string(obj) == "{\"a\": 2, \"z\": 1}");
}

TEST_CASE("format_number", "[value][render]") {
    REQUIRE(format_number(0) == "0");
    REQUIRE(format_number(-7) == "-7");
    REQUIRE(format_number(0.25) == "0.25");
    REQUIRE(format_number(1e20) == "1e+20");
}

// ============================================================
// Hashing and sets
// ============================================================

TEST_CASE("hash_value", "[value][hash]") {
    SECTION("structurally equal values hash alike") {
        Value a = Value::object({{"x", 1}, {"y", Value::list({"a", "b"})}});
        Value b = Value::object({{"y", Value::list({"a", "b"})}, {"x", 1}});
        REQUIRE(hash_value(a).has_value());
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("kinds are kept apart") {
        REQUIRE(hash_value(Value{1}) != hash_value(Value{"1"}));
        REQUIRE(hash_value(Value{1}) != hash_value(Value::list({1})));
    }

    SECTION("negative zero") {
        REQUIRE(hash_value(Value{0.0}) == hash_value(Value{-0.0}));
    }

    SECTION("unknowns have no identity") {
        REQUIRE_FALSE(hash_value(Value::unknown()).has_value());
        REQUIRE_FALSE(hash_value(Value::list({1, Value::unknown()})).has_value());
        REQUIRE_FALSE(hash_value(Value::object({{"k", Value::unknown()}})).has_value());
    }

    SECTION("secret marks are ignored") {
        REQUIRE(hash_value(Value::make_secret(Value{"s"})) == hash_value(Value{"s"}));
    }
}

TEST_CASE("compare_values is a total order", "[value][hash]") {
    REQUIRE(std::is_lt(compare_values(Value{1}, Value{2})));
    REQUIRE(std::is_gt(compare_values(Value{"b"}, Value{"a"})));
    REQUIRE(std::is_eq(compare_values(Value::list({1, 2}), Value::list({1, 2}))));
    REQUIRE(std::is_lt(compare_values(Value::list({1}), Value::list({1, 2}))));
    // Different kinds order by kind
    REQUIRE(std::is_neq(compare_values(Value{true}, Value{"x"})));
}

TEST_CASE("Sets are canonical", "[value][set]") {
    SECTION("permutation invariance") {
        Value a = Value::set({"a", "b", "c"});
        Value b = Value::set({"c", "a", "b"});
        REQUIRE(a == b);
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("duplicates collapse") {
        Value s = Value::set({1, 2, 2, 1});
        REQUIRE(s.is_set());
        REQUIRE(s.size() == 2);
        REQUIRE(s == Value::set({2, 1}));
    }

    SECTION("block elements compare by content") {
        Value a = Value::set({Value::object({{"port", 80}}), Value::object({{"port", 443}})});
        Value b = Value::set({Value::object({{"port", 443}}), Value::object({{"port", 80}})});
        REQUIRE(a == b);
    }

    SECTION("a collapsed duplicate keeps the secret mark") {
        Value plain_first = Value::set({"pw", Value::make_secret(Value{"pw"})});
        Value secret_first = Value::set({Value::make_secret(Value{"pw"}), "pw"});
        REQUIRE(plain_first.size() == 1);
        REQUIRE(plain_first.at(std::size_t{0}).secret);
        REQUIRE(secret_first.size() == 1);
        REQUIRE(secret_first.at(std::size_t{0}).secret);
    }

    SECTION("nested secret marks merge across duplicates") {
        Value s = Value::set({
            Value::object({{"user", "u"}, {"key", "k"}}),
            Value::object({{"user", "u"}, {"key", Value::make_secret(Value{"k"})}}),
        });
        REQUIRE(s.size() == 1);
        REQUIRE(s.at(std::size_t{0}).at("key").secret);
        REQUIRE_FALSE(s.at(std::size_t{0}).at("user").secret);
    }

    SECTION("elements without identity are kept") {
        Value s = Value::set({1, Value::unknown()});
        REQUIRE(s.size() == 2);
        REQUIRE_FALSE(hashed_elements(*s.get_if<ValueSet>()).has_value());
    }
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("Builders", "[value][builder]") {
    SECTION("ObjectBuilder") {
        Value v = ObjectBuilder()
            .set("name", "web")
            .set("port", 8080)
            .set("tags", Value::list({"a"}))
            .finish();
        REQUIRE(v.size() == 3);
        REQUIRE(v.at("port").as_number() == 8080.0);
    }

    SECTION("ObjectBuilder from an existing value") {
        Value base = Value::object({{"a", 1}, {"b", 2}});
        ObjectBuilder builder{base};
        builder.erase("a").set("c", 3);
        REQUIRE(builder.contains("c"));
        REQUIRE(builder.get("b").as_number() == 2.0);
        Value v = builder.finish();
        REQUIRE(v == Value::object({{"b", 2}, {"c", 3}}));
    }

    SECTION("ListBuilder") {
        ListBuilder builder;
        for (int i = 0; i < 5; ++i) {
            builder.push_back(i);
        }
        REQUIRE(builder.size() == 5);
        Value v = builder.finish();
        REQUIRE(v == Value::list({0, 1, 2, 3, 4}));
    }

    SECTION("SetBuilder canonicalizes") {
        Value v = SetBuilder().insert("b").insert("a").insert("b").finish();
        REQUIRE(v == Value::set({"a", "b"}));
    }
}
