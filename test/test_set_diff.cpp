// test_set_diff.cpp - Tests for the hash-identified set differ

#include <catch2/catch_all.hpp>
#include <provbridge/differ.h>
#include <provbridge/schema.h>

#include <string>

using namespace provbridge;

// ============================================================
// Helper Functions
// ============================================================

namespace {

SchemaPtr set_schema() {
    return SchemaBuilder::block()
        .field("tags", SchemaBuilder::set(SchemaBuilder::string()).optional())
        .field("ports", SchemaBuilder::set(SchemaBuilder::number()).optional().force_new())
        .field("rules", SchemaBuilder::set(
                            SchemaBuilder::block()
                                .field("port", SchemaBuilder::number().optional())
                                .field("proto", SchemaBuilder::string().optional())).optional())
        .finish();
}

DiffResult diff_of(const SchemaPtr& schema, const Value& old_value, const Value& new_value) {
    return detailed_diff(schema, conform(*schema, old_value), conform(*schema, new_value));
}

std::string kind_at(const DiffResult& result, std::string_view path) {
    const DiffEntry* entry = result.find(path);
    return entry ? std::string{to_string(wire_kind(*entry))} : std::string{"<none>"};
}

Value tags(std::initializer_list<Value> items) {
    return Value::object({{"tags", Value::list(items)}});
}

} // namespace

// ============================================================
// Identity matching
// ============================================================

TEST_CASE("Set diff ignores order and duplicates", "[diff][set]") {
    auto schema = set_schema();

    REQUIRE(diff_of(schema, tags({"a", "b", "c"}), tags({"c", "a", "b"})).empty());
    REQUIRE(diff_of(schema, tags({"a", "b"}), tags({"b", "a", "a"})).empty());
}

TEST_CASE("Set diff of an inserted element", "[diff][set]") {
    auto schema = set_schema();
    auto result = diff_of(schema, tags({"a", "b"}), tags({"a", "b", "c"}));

    // Matched elements produce nothing; the new one is a single add
    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "tags[0]") == "ADD");
    REQUIRE(result.find("tags[0]")->new_value.as_string() == "c");
}

TEST_CASE("Set diff of a removed element", "[diff][set]") {
    auto schema = set_schema();
    auto result = diff_of(schema, tags({"a", "b", "c"}), tags({"a", "c"}));

    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "tags[0]") == "DELETE");
    REQUIRE(result.find("tags[0]")->old_value.as_string() == "b");
}

TEST_CASE("Set diff pairs a removed and an added element", "[diff][set]") {
    auto schema = set_schema();
    auto result = diff_of(schema, tags({"a", "b"}), tags({"a", "z"}));

    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "tags[0]") == "UPDATE");
    const DiffEntry* entry = result.find("tags[0]");
    REQUIRE(entry->old_value.as_string() == "b");
    REQUIRE(entry->new_value.as_string() == "z");
}

TEST_CASE("Set diff with surplus adds", "[diff][set]") {
    auto schema = set_schema();
    auto result = diff_of(schema, tags({"a"}), tags({"x", "y", "z"}));

    REQUIRE(result.size() == 3);
    REQUIRE(kind_at(result, "tags[0]") == "UPDATE");
    REQUIRE(kind_at(result, "tags[1]") == "ADD");
    REQUIRE(kind_at(result, "tags[2]") == "ADD");
}

TEST_CASE("Set diff treats block elements as a whole", "[diff][set][nested]") {
    auto schema = set_schema();
    Value old_value = Value::object({{"rules", Value::list({
        Value::object({{"port", 80}, {"proto", "tcp"}}),
        Value::object({{"port", 443}, {"proto", "tcp"}}),
    })}});
    Value new_value = Value::object({{"rules", Value::list({
        Value::object({{"port", 443}, {"proto", "tcp"}}),
        Value::object({{"port", 80}, {"proto", "udp"}}),
    })}});

    auto result = diff_of(schema, old_value, new_value);

    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "rules[0]") == "UPDATE");
    REQUIRE(result.find("rules[0].proto") == nullptr);
    REQUIRE(result.find("rules[0]")->new_value.at("proto").as_string() == "udp");
}

TEST_CASE("Set diff under ForceNew replaces", "[diff][set][replace]") {
    auto schema = set_schema();
    Value old_value = Value::object({{"ports", Value::list({80, 443})}});
    Value new_value = Value::object({{"ports", Value::list({80, 8443})}});

    auto result = diff_of(schema, old_value, new_value);

    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "ports[0]") == "UPDATE_REPLACE");
    REQUIRE(result.replace);
}

TEST_CASE("Set diff of elements with unknowns", "[diff][set][unknown]") {
    auto schema = set_schema();

    SECTION("unchanged sets are fine") {
        Value v = tags({"a", Value::unknown()});
        REQUIRE(diff_of(schema, v, v).empty());
    }

    SECTION("a changed set is one update at its own path") {
        auto result = diff_of(schema, tags({"a"}), tags({"a", Value::unknown()}));
        REQUIRE(result.size() == 1);
        REQUIRE(kind_at(result, "tags") == "UPDATE");
        REQUIRE_FALSE(result.replace);
    }

    SECTION("blocks with a provider-filled field") {
        Value old_value = Value::object({{"rules", Value::list({
            Value::object({{"port", 80}, {"proto", "tcp"}}),
        })}});
        Value new_value = Value::object({{"rules", Value::list({
            Value::object({{"port", 80}, {"proto", Value::unknown()}}),
            Value::object({{"port", 443}, {"proto", Value::unknown()}}),
        })}});

        auto result = diff_of(schema, old_value, new_value);
        REQUIRE(result.size() == 1);
        REQUIRE(kind_at(result, "rules") == "UPDATE");
        REQUIRE(result.find("rules")->new_value.size() == 2);
    }

    SECTION("under ForceNew the update replaces") {
        Value old_value = Value::object({{"ports", Value::list({80})}});
        Value new_value = Value::object({{"ports", Value::list({80, Value::unknown()})}});

        auto result = diff_of(schema, old_value, new_value);
        REQUIRE(kind_at(result, "ports") == "UPDATE_REPLACE");
        REQUIRE(result.replace);
    }

    SECTION("a wholly unknown set is an update") {
        auto result = diff_of(schema, tags({"a"}), Value::object({{"tags", Value::unknown()}}));
        REQUIRE(kind_at(result, "tags") == "UPDATE");
    }
}
