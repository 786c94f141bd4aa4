// test_secrets.cpp - Tests for secret propagation, the state codec and diff annotation

#include <catch2/catch_all.hpp>
#include <provbridge/differ.h>
#include <provbridge/json.h>
#include <provbridge/schema.h>
#include <provbridge/secrets.h>

#include <string>

using namespace provbridge;

// ============================================================
// Helper Functions
// ============================================================

namespace {

SchemaPtr secret_schema() {
    return SchemaBuilder::block()
        .field("user", SchemaBuilder::string().optional())
        .field("password", SchemaBuilder::string().optional().sensitive())
        .field("token", SchemaBuilder::string().optional())
        .field("auth", SchemaBuilder::list(
                           SchemaBuilder::block()
                               .field("key", SchemaBuilder::string().optional())
                               .field("cert", SchemaBuilder::string().optional()))
                       .singleton().optional())
        .field("keys", SchemaBuilder::set(SchemaBuilder::string()).optional())
        .field("hosts", SchemaBuilder::list(SchemaBuilder::string()).optional())
        .finish();
}

} // namespace

// ============================================================
// Propagation
// ============================================================

TEST_CASE("propagate_secrets marks sensitive fields", "[secrets][propagate]") {
    auto schema = secret_schema();
    Value outputs = Value::object({{"user", "admin"}, {"password", "pw"}});

    Value marked = propagate_secrets(*schema, outputs, {});
    REQUIRE(marked.at("password").secret);
    REQUIRE_FALSE(marked.at("user").secret);
    REQUIRE(marked == outputs);
}

TEST_CASE("propagate_secrets copies marks from sources", "[secrets][propagate]") {
    auto schema = secret_schema();

    SECTION("leaf") {
        Value inputs = Value::object({{"token", Value::make_secret(Value{"t0"})}});
        Value outputs = Value::object({{"token", "t1"}, {"user", "u"}});

        Value marked = propagate_secrets(*schema, outputs, {inputs});
        REQUIRE(marked.at("token").secret);
        REQUIRE_FALSE(marked.at("user").secret);
    }

    SECTION("nested block") {
        Value inputs = Value::object({{"auth", Value::object({{"key", Value::make_secret(Value{"k"})}})}});
        Value outputs = Value::object({{"auth", Value::object({{"key", "k2"}, {"cert", "c"}})}});

        Value marked = propagate_secrets(*schema, outputs, {inputs});
        REQUIRE(marked.at("auth").at("key").secret);
        REQUIRE_FALSE(marked.at("auth").at("cert").secret);
    }

    SECTION("a secret anywhere in a source set marks the whole set") {
        Value inputs = Value::object({{"keys", Value::set({"a", Value::make_secret(Value{"b"})})}});
        Value outputs = Value::object({{"keys", Value::set({"a", "c"})}});

        Value marked = propagate_secrets(*schema, outputs, {inputs});
        REQUIRE(marked.at("keys").secret);
    }

    SECTION("list elements by position") {
        Value inputs = Value::object({{"hosts", Value::list({"h0", Value::make_secret(Value{"h1"})})}});
        Value outputs = Value::object({{"hosts", Value::list({"x", "y", "z"})}});

        Value marked = propagate_secrets(*schema, outputs, {inputs});
        REQUIRE_FALSE(marked.at("hosts").at(std::size_t{0}).secret);
        REQUIRE(marked.at("hosts").at(std::size_t{1}).secret);
        REQUIRE_FALSE(marked.at("hosts").at(std::size_t{2}).secret);
    }

    SECTION("a secret parent marks the subtree") {
        Value inputs = Value::object({{"auth", Value::make_secret(Value::object({{"key", "k"}}))}});
        Value outputs = Value::object({{"auth", Value::object({{"key", "k"}})}});

        Value marked = propagate_secrets(*schema, outputs, {inputs});
        REQUIRE(marked.at("auth").secret);
    }
}

// ============================================================
// State codec
// ============================================================

TEST_CASE("encode_state wraps secrets in the sentinel", "[secrets][codec]") {
    Value state = Value::object({{"user", "u"}, {"password", Value::make_secret(Value{"pw"})}});
    Value encoded = encode_state(state);

    REQUIRE(encoded.at("user").as_string() == "u");
    Value wrapped = encoded.at("password");
    REQUIRE(is_secret_sentinel(wrapped));
    REQUIRE(wrapped.at(std::string{kSecretSigKey}).as_string() == kSecretSigValue);
    REQUIRE(wrapped.at("value").as_string() == "pw");
    REQUIRE_FALSE(contains_secret(encoded));

    SECTION("decode restores the marks") {
        Value decoded = decode_state(encoded);
        REQUIRE(decoded == state);
        REQUIRE(decoded.at("password").secret);
        REQUIRE_FALSE(decoded.at("user").secret);
    }

    SECTION("the encoding survives JSON") {
        Value decoded = decode_state(from_json(to_json(encoded, true)));
        REQUIRE(decoded.at("password").secret);
        REQUIRE(decoded.at("password").as_string() == "pw");
    }
}

TEST_CASE("Duplicate set elements keep their secret mark through the codec", "[secrets][codec]") {
    auto schema = secret_schema();
    Value state = Value::object({{"keys", Value::list({"k", Value::make_secret(Value{"k"}), "k"})}});

    Value conformed = conform(*schema, state);
    REQUIRE(conformed.at("keys").size() == 1);
    REQUIRE(contains_secret(conformed.at("keys")));

    Value reloaded = decode_state(from_json(to_json(encode_state(conformed))));
    REQUIRE(contains_secret(conform(*schema, reloaded).at("keys")));
}

TEST_CASE("is_secret_sentinel", "[secrets][codec]") {
    REQUIRE_FALSE(is_secret_sentinel(Value{"x"}));
    REQUIRE_FALSE(is_secret_sentinel(Value::object({{"value", 1}})));
    REQUIRE_FALSE(is_secret_sentinel(Value::object({{std::string{kSecretSigKey}, "wrong"}, {"value", 1}})));
    REQUIRE(is_secret_sentinel(Value::object({{std::string{kSecretSigKey}, std::string{kSecretSigValue}},
                                              {"value", 1}})));
}

TEST_CASE("Secret marks survive persist and reload", "[secrets][property]") {
    auto schema = secret_schema();
    Value inputs = Value::object({
        {"token", Value::make_secret(Value{"t"})},
        {"auth", Value::object({{"cert", Value::make_secret(Value{"c"})}})},
        {"hosts", Value::list({"a", Value::make_secret(Value{"b"})})},
    });
    Value outputs = Value::object({
        {"token", "t"},
        {"password", "pw"},
        {"auth", Value::object({{"cert", "c"}, {"key", "k"}})},
        {"hosts", Value::list({"a", "b"})},
        {"user", "u"},
    });

    Value reloaded = decode_state(from_json(to_json(persist_state(*schema, outputs, {inputs}))));

    for (const char* text : {"token", "password", "auth.cert", "hosts[1]"}) {
        INFO("path " << text);
        REQUIRE(get_at_path(reloaded, PropertyPath::parse(text)).secret);
    }
    for (const char* text : {"user", "auth.key", "hosts[0]"}) {
        INFO("path " << text);
        REQUIRE_FALSE(get_at_path(reloaded, PropertyPath::parse(text)).secret);
    }
}

// ============================================================
// Diff annotation
// ============================================================

TEST_CASE("annotate_secrets", "[secrets][annotate]") {
    auto schema = secret_schema();

    SECTION("sensitive field") {
        Value old_value = Value::object({{"password", "a"}, {"user", "x"}});
        Value new_value = Value::object({{"password", "b"}, {"user", "y"}});
        DiffResult result = detailed_diff(schema, old_value, new_value);
        annotate_secrets(*schema, old_value, new_value, result);

        REQUIRE(result.find("password")->secret);
        REQUIRE_FALSE(result.find("user")->secret);
    }

    SECTION("secret parent") {
        Value old_value = Value::object({{"auth", Value::make_secret(Value::object({{"key", "a"}}))}});
        Value new_value = Value::object({{"auth", Value::make_secret(Value::object({{"key", "b"}}))}});
        DiffResult result = detailed_diff(schema, old_value, new_value);
        annotate_secrets(*schema, old_value, new_value, result);

        REQUIRE(result.find("auth.key")->secret);
    }

    SECTION("secret value in the entry") {
        Value old_value = Value::object({});
        Value new_value = Value::object({{"token", Value::make_secret(Value{"t"})}});
        DiffResult result = detailed_diff(schema, old_value, new_value);
        annotate_secrets(*schema, old_value, new_value, result);

        REQUIRE(result.find("token")->secret);
    }
}
