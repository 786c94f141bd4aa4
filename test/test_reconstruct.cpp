// test_reconstruct.cpp - Tests for input reconstruction after validation failures

#include <catch2/catch_all.hpp>
#include <provbridge/reconstruct.h>
#include <provbridge/schema.h>

#include <string>

using namespace provbridge;

// ============================================================
// Helper Functions
// ============================================================

namespace {

SchemaPtr reconstruct_schema() {
    return SchemaBuilder::block()
        .field("name", SchemaBuilder::string().required())
        .field("arn", SchemaBuilder::string().optional().computed())
        .field("size", SchemaBuilder::number().optional())
        .field("nodes", SchemaBuilder::list(
                            SchemaBuilder::block()
                                .field("ip", SchemaBuilder::string().optional().computed())
                                .field("role", SchemaBuilder::string().required())).optional())
        .finish();
}

Value inputs() {
    return Value::object({
        {"name", "cluster"},
        {"arn", "arn:stale"},
        {"size", 3},
        {"nodes", Value::list({Value::object({{"ip", "10.0.0.1"}, {"role", "leader"}})})},
    });
}

} // namespace

// ============================================================
// Reconstruction
// ============================================================

TEST_CASE("No failures leaves the inputs unchanged", "[reconstruct]") {
    auto schema = reconstruct_schema();
    REQUIRE(reconstruct_inputs(*schema, inputs(), {}) == inputs());
}

TEST_CASE("Computed inputs rejected by the provider are dropped", "[reconstruct]") {
    auto schema = reconstruct_schema();
    std::vector<ValidationFailure> failures{
        {"arn", "Computed attribute cannot be set"},
        {"nodes[0].ip", "Computed attribute cannot be set"},
    };

    Value result = reconstruct_inputs(*schema, inputs(), failures);

    REQUIRE_FALSE(result.contains("arn"));
    REQUIRE_FALSE(result.at("nodes").at(std::size_t{0}).contains("ip"));
    REQUIRE(result.at("nodes").at(std::size_t{0}).at("role").as_string() == "leader");
    REQUIRE(result.at("size").as_number() == 3.0);
}

TEST_CASE("Other failures are reported together", "[reconstruct][error]") {
    auto schema = reconstruct_schema();
    std::vector<ValidationFailure> failures{
        {"arn", "Computed attribute cannot be set"},
        {"size", "must be even"},
        {"name", "too short"},
        {"nope", "unknown field"},
    };

    try {
        (void)reconstruct_inputs(*schema, inputs(), failures);
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.failures().size() == 3);
        REQUIRE(e.failures()[0].path == "size");
        REQUIRE(e.failures()[1].path == "name");
        REQUIRE(e.failures()[2].path == "nope");
        const std::string message = e.what();
        REQUIRE(message.find("3 validation failures") == 0);
        REQUIRE(message.find("size: must be even") != std::string::npos);
    }
}

TEST_CASE("Unparseable and root failure paths are fatal", "[reconstruct][error]") {
    auto schema = reconstruct_schema();

    REQUIRE_THROWS_AS(reconstruct_inputs(*schema, inputs(), {{"nodes[", "bad"}}), ValidationError);

    try {
        (void)reconstruct_inputs(*schema, inputs(), {{"", "resource is invalid"}});
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(std::string{e.what()} == "1 validation failure: <root>: resource is invalid");
    }
}
