// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Static shape description of a resource.
///
/// A schema is built once per resource type and then shared read-only by
/// every diff request for that type (SchemaPtr is a shared_ptr to const).
///
/// @code
///   SchemaPtr schema = SchemaBuilder::block()
///       .field("name", SchemaBuilder::string().required().force_new())
///       .field("tags", SchemaBuilder::set(SchemaBuilder::string()).optional())
///       .field("rule", SchemaBuilder::list(
///                          SchemaBuilder::block().field("port", SchemaBuilder::number().optional()))
///                      .singleton().optional())
///       .finish();
/// @endcode

#pragma once

#include <provbridge/api.h>
#include <provbridge/errors.h>
#include <provbridge/path.h>
#include <provbridge/value.h>

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace provbridge {

enum class SchemaKind {
    Scalar,
    List,
    Set,
    Map,
    Block,
};

enum class ScalarType {
    Bool,
    Number,
    String,
    Dynamic,  ///< any value
};

struct SchemaNode;
using SchemaPtr = std::shared_ptr<const SchemaNode>;

struct PROVBRIDGE_API SchemaNode {
    SchemaKind kind = SchemaKind::Scalar;
    ScalarType scalar = ScalarType::Dynamic;

    SchemaPtr elem;                          ///< List, Set and Map element
    std::map<std::string, SchemaPtr> fields; ///< Block fields

    bool singleton = false;  ///< max-items-one List/Set, addressed as its element
    bool required = false;
    bool optional = false;
    bool computed = false;
    bool force_new = false;
    bool sensitive = false;

    [[nodiscard]] bool is_collection() const noexcept {
        return kind == SchemaKind::List || kind == SchemaKind::Set;
    }

    /// Field schema, or nullptr for undeclared fields
    [[nodiscard]] const SchemaNode* field(const std::string& name) const {
        auto it = fields.find(name);
        return it == fields.end() ? nullptr : it->second.get();
    }

    /// Schema of the value a singleton collection collapses to
    [[nodiscard]] const SchemaNode* collapsed() const noexcept {
        return singleton ? elem.get() : this;
    }
};

/// Fluent SchemaNode construction; finish() validates
class PROVBRIDGE_API SchemaBuilder {
public:
    static SchemaBuilder scalar(ScalarType type);
    static SchemaBuilder boolean() { return scalar(ScalarType::Bool); }
    static SchemaBuilder number() { return scalar(ScalarType::Number); }
    static SchemaBuilder string() { return scalar(ScalarType::String); }
    static SchemaBuilder dynamic() { return scalar(ScalarType::Dynamic); }

    static SchemaBuilder list(const SchemaBuilder& elem);
    static SchemaBuilder set(const SchemaBuilder& elem);
    static SchemaBuilder map(const SchemaBuilder& elem);
    static SchemaBuilder block();

    static SchemaBuilder list(SchemaPtr elem);
    static SchemaBuilder set(SchemaPtr elem);
    static SchemaBuilder map(SchemaPtr elem);

    SchemaBuilder& field(const std::string& name, const SchemaBuilder& schema);
    SchemaBuilder& field(const std::string& name, SchemaPtr schema);

    SchemaBuilder& singleton(bool v = true) { node_.singleton = v; return *this; }
    SchemaBuilder& required(bool v = true) { node_.required = v; return *this; }
    SchemaBuilder& optional(bool v = true) { node_.optional = v; return *this; }
    SchemaBuilder& computed(bool v = true) { node_.computed = v; return *this; }
    SchemaBuilder& force_new(bool v = true) { node_.force_new = v; return *this; }
    SchemaBuilder& sensitive(bool v = true) { node_.sensitive = v; return *this; }

    /// @throws SchemaError if the node is inconsistent
    [[nodiscard]] SchemaPtr finish() const;

private:
    explicit SchemaBuilder(SchemaKind kind) { node_.kind = kind; }

    SchemaNode node_;
};

/// Normalize a value tree against its schema.
///
/// - a singleton collection given as a 0/1-element list or set becomes null
///   or its element
/// - a list given for a Set node becomes a canonical set
/// - Null and Unknown are accepted anywhere
///
/// Undeclared block fields are kept unchanged. Secret bits are preserved.
/// @throws TypeMismatchError when the value's shape contradicts the schema
[[nodiscard]] PROVBRIDGE_API Value conform(const SchemaNode& schema, const Value& value,
                                           const PropertyPath& path = {});

/// SchemaNode governing `path`, or nullptr (undeclared or shape mismatch)
[[nodiscard]] PROVBRIDGE_API const SchemaNode* lookup_schema(const SchemaNode& root,
                                                            const PropertyPath& path);

/// Load a schema from its JSON description:
///
/// ```
/// {"type": "block", "fields": {
///     "name": {"type": "string", "required": true, "forceNew": true},
///     "rule": {"type": "list", "maxItems": 1, "elem": {"type": "block", "fields": {}}}}}
/// ```
///
/// Types: bool, number, string, dynamic, list, set, map, block. Flags:
/// required, optional, computed, forceNew, sensitive, singleton (or maxItems 1).
/// @throws JsonError, SchemaError
[[nodiscard]] PROVBRIDGE_API SchemaPtr schema_from_json(std::string_view json);

/// @copydoc schema_from_json
[[nodiscard]] PROVBRIDGE_API SchemaPtr schema_from_value(const Value& description);

[[nodiscard]] PROVBRIDGE_API std::string_view kind_name(const SchemaNode& schema);

} // namespace provbridge
