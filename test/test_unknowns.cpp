// test_unknowns.cpp - Tests for unknown and computed value handling

#include <catch2/catch_all.hpp>
#include <provbridge/differ.h>
#include <provbridge/schema.h>
#include <provbridge/unknowns.h>

#include <string>

using namespace provbridge;

// ============================================================
// Helper Functions
// ============================================================

namespace {

SchemaPtr compute_schema() {
    return SchemaBuilder::block()
        .field("name", SchemaBuilder::string().required())
        .field("arn", SchemaBuilder::string().computed())
        .field("zone", SchemaBuilder::string().optional().computed())
        .field("image", SchemaBuilder::string().optional().computed().force_new())
        .field("size", SchemaBuilder::number().optional())
        .field("network", SchemaBuilder::list(
                              SchemaBuilder::block()
                                  .field("subnet", SchemaBuilder::string().optional())
                                  .field("address", SchemaBuilder::string().optional().computed()))
                          .singleton().optional().force_new())
        .field("disks", SchemaBuilder::list(
                            SchemaBuilder::block().field("size", SchemaBuilder::number().optional())).optional())
        .finish();
}

DiffResult diff_of(const SchemaPtr& schema, const Value& old_value, const Value& new_value,
                   const DiffOptions& options = {}) {
    return detailed_diff(schema, conform(*schema, old_value), conform(*schema, new_value), options);
}

std::string kind_at(const DiffResult& result, std::string_view path) {
    const DiffEntry* entry = result.find(path);
    return entry ? std::string{to_string(wire_kind(*entry))} : std::string{"<none>"};
}

} // namespace

// ============================================================
// classify_node
// ============================================================

TEST_CASE("classify_node", "[unknowns][classify]") {
    auto computed = SchemaBuilder::string().computed().finish();
    auto plain = SchemaBuilder::string().optional().finish();
    DiffOptions options;

    SECTION("new unknown") {
        REQUIRE(classify_node(plain.get(), Value{}, Value::unknown(), false, options) == NodeOutcome::Add);
        REQUIRE(classify_node(plain.get(), Value{"a"}, Value::unknown(), false, options) == NodeOutcome::Update);
    }

    SECTION("old unknown") {
        REQUIRE(classify_node(plain.get(), Value::unknown(), Value{"a"}, false, options) == NodeOutcome::Update);
        REQUIRE(classify_node(plain.get(), Value::unknown(), Value{}, false, options) == NodeOutcome::Delete);
    }

    SECTION("presence") {
        REQUIRE(classify_node(plain.get(), Value{}, Value{"a"}, false, options) == NodeOutcome::Add);
        REQUIRE(classify_node(plain.get(), Value{"a"}, Value{}, false, options) == NodeOutcome::Delete);
        REQUIRE(classify_node(plain.get(), Value{"a"}, Value{"b"}, false, options) == NodeOutcome::Descend);
    }

    SECTION("computed absent") {
        REQUIRE(classify_node(computed.get(), Value{"a"}, Value{}, false, options) == NodeOutcome::Suppress);
        REQUIRE(classify_node(computed.get(), Value{"a"}, Value{}, true, options) == NodeOutcome::Delete);

        DiffOptions strict;
        strict.collapse_computed_absent = false;
        REQUIRE(classify_node(computed.get(), Value{"a"}, Value{}, false, strict) == NodeOutcome::Delete);
    }

    SECTION("undeclared values are never left to the provider") {
        REQUIRE_FALSE(left_to_provider(nullptr, Value{}, false, options));
        REQUIRE(classify_node(nullptr, Value{"a"}, Value{}, false, options) == NodeOutcome::Delete);
    }
}

// ============================================================
// Computed values
// ============================================================

TEST_CASE("Computed values absent from the inputs are left to the provider", "[unknowns][computed]") {
    auto schema = compute_schema();
    Value state = Value::object({{"name", "vm"}, {"arn", "arn:1"}, {"zone", "a"}});
    Value inputs = Value::object({{"name", "vm"}});

    auto result = diff_of(schema, state, inputs);
    REQUIRE(result.empty());
}

TEST_CASE("Computed ForceNew value absent from the inputs replaces", "[unknowns][computed][replace]") {
    auto schema = compute_schema();
    Value state = Value::object({{"name", "vm"}, {"image", "ubuntu"}});
    Value inputs = Value::object({{"name", "vm"}});

    auto result = diff_of(schema, state, inputs);
    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "image") == "DELETE_REPLACE");
    REQUIRE(result.replace);
}

TEST_CASE("Computed value under a ForceNew block", "[unknowns][computed][replace]") {
    auto schema = compute_schema();
    Value state = Value::object({{"name", "vm"}, {"network", Value::object({{"subnet", "s1"}, {"address", "10.0.0.1"}})}});
    Value inputs = Value::object({{"name", "vm"}, {"network", Value::object({{"subnet", "s1"}})}});

    auto result = diff_of(schema, state, inputs);
    REQUIRE(result.size() == 1);
    REQUIRE(kind_at(result, "network.address") == "DELETE_REPLACE");
}

TEST_CASE("Non-computed value absent from the inputs is deleted", "[unknowns][computed]") {
    auto schema = compute_schema();
    auto result = diff_of(schema, Value::object({{"name", "vm"}, {"size", 2}}), Value::object({{"name", "vm"}}));
    REQUIRE(kind_at(result, "size") == "DELETE");
}

TEST_CASE("Computed collapse can be switched off", "[unknowns][computed]") {
    auto schema = compute_schema();
    DiffOptions options;
    options.collapse_computed_absent = false;

    auto result = diff_of(schema, Value::object({{"name", "vm"}, {"zone", "a"}}), Value::object({{"name", "vm"}}),
                          options);
    REQUIRE(kind_at(result, "zone") == "DELETE");
}

// ============================================================
// Unknown values
// ============================================================

TEST_CASE("Unknown inputs", "[unknowns][unknown]") {
    auto schema = compute_schema();

    SECTION("unknown replacing a known value") {
        auto result = diff_of(schema, Value::object({{"name", "vm"}}), Value::object({{"name", Value::unknown()}}));
        REQUIRE(kind_at(result, "name") == "UPDATE");
    }

    SECTION("unknown where nothing was") {
        auto result = diff_of(schema, Value::object({{"name", "vm"}}),
                              Value::object({{"name", "vm"}, {"size", Value::unknown()}}));
        REQUIRE(kind_at(result, "size") == "ADD");
    }

    SECTION("unknown list") {
        auto result = diff_of(schema, Value::object({{"disks", Value::list({Value::object({{"size", 1}})})}}),
                              Value::object({{"disks", Value::unknown()}}));
        REQUIRE(result.size() == 1);
        REQUIRE(kind_at(result, "disks") == "UPDATE");
    }

    SECTION("unknown on both sides") {
        Value v = Value::object({{"name", Value::unknown()}});
        REQUIRE(diff_of(schema, v, v).empty());
    }

    SECTION("unknown state becoming known") {
        auto result = diff_of(schema, Value::object({{"size", Value::unknown()}}), Value::object({{"size", 3}}));
        REQUIRE(kind_at(result, "size") == "UPDATE");
    }
}

TEST_CASE("Replacing a leaf with an unknown always reports a change", "[unknowns][unknown][property]") {
    auto schema = compute_schema();
    Value state = Value::object({
        {"name", "vm"},
        {"size", 4},
        {"network", Value::object({{"subnet", "s1"}})},
        {"disks", Value::list({Value::object({{"size", 10}}), Value::object({{"size", 20}})})},
    });
    Value conformed = conform(*schema, state);

    for (const char* text : {"name", "size", "network.subnet", "disks[0].size", "disks[1].size", "disks[1]", "disks"}) {
        const PropertyPath leaf = PropertyPath::parse(text);
        Value inputs = set_at_path(conformed, leaf, Value::unknown());

        auto result = diff_of(schema, conformed, inputs);

        bool covered = false;
        for (const auto& [path, entry] : result.entries) {
            covered = covered || leaf.starts_with(path);
        }
        INFO("leaf " << text);
        REQUIRE(covered);
    }
}
