// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.cpp
/// @brief SchemaBuilder, conform(), lookup_schema() and the JSON schema loader.

#include <provbridge/schema.h>
#include <provbridge/json.h>
#include <provbridge/value_hash.h>

#include <optional>

namespace provbridge {

// ============================================================
// SchemaBuilder
// ============================================================

SchemaBuilder SchemaBuilder::scalar(ScalarType type)
{
    SchemaBuilder b{SchemaKind::Scalar};
    b.node_.scalar = type;
    return b;
}

SchemaBuilder SchemaBuilder::list(const SchemaBuilder& elem) { return list(elem.finish()); }
SchemaBuilder SchemaBuilder::set(const SchemaBuilder& elem) { return set(elem.finish()); }
SchemaBuilder SchemaBuilder::map(const SchemaBuilder& elem) { return map(elem.finish()); }

SchemaBuilder SchemaBuilder::list(SchemaPtr elem)
{
    SchemaBuilder b{SchemaKind::List};
    b.node_.elem = std::move(elem);
    return b;
}

SchemaBuilder SchemaBuilder::set(SchemaPtr elem)
{
    SchemaBuilder b{SchemaKind::Set};
    b.node_.elem = std::move(elem);
    return b;
}

SchemaBuilder SchemaBuilder::map(SchemaPtr elem)
{
    SchemaBuilder b{SchemaKind::Map};
    b.node_.elem = std::move(elem);
    return b;
}

SchemaBuilder SchemaBuilder::block()
{
    return SchemaBuilder{SchemaKind::Block};
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, const SchemaBuilder& schema)
{
    return field(name, schema.finish());
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, SchemaPtr schema)
{
    if (node_.kind != SchemaKind::Block) {
        throw SchemaError("field '" + name + "' added to a " + std::string{kind_name(node_)} + " schema");
    }
    if (!schema) {
        throw SchemaError("field '" + name + "' has no schema");
    }
    node_.fields[name] = std::move(schema);
    return *this;
}

SchemaPtr SchemaBuilder::finish() const
{
    const bool has_elem = node_.kind == SchemaKind::List || node_.kind == SchemaKind::Set ||
                          node_.kind == SchemaKind::Map;
    if (has_elem && !node_.elem) {
        throw SchemaError(std::string{kind_name(node_)} + " schema has no element schema");
    }
    if (!has_elem && node_.elem) {
        throw SchemaError(std::string{kind_name(node_)} + " schema cannot have an element schema");
    }
    if (node_.singleton && !node_.is_collection()) {
        throw SchemaError("singleton is only valid on list and set schemas, not " +
                          std::string{kind_name(node_)});
    }
    if (node_.required && node_.optional) {
        throw SchemaError("a schema cannot be both required and optional");
    }
    if (node_.required && node_.computed) {
        throw SchemaError("a schema cannot be both required and computed");
    }
    return std::make_shared<const SchemaNode>(node_);
}

std::string_view kind_name(const SchemaNode& schema)
{
    switch (schema.kind) {
        case SchemaKind::Scalar:
            switch (schema.scalar) {
                case ScalarType::Bool: return "bool";
                case ScalarType::Number: return "number";
                case ScalarType::String: return "string";
                case ScalarType::Dynamic: return "dynamic";
            }
            break;
        case SchemaKind::List: return "list";
        case SchemaKind::Set: return "set";
        case SchemaKind::Map: return "map";
        case SchemaKind::Block: return "block";
    }
    return "unknown";
}

// ============================================================
// conform
// ============================================================

namespace {

[[noreturn]] void mismatch(const SchemaNode& schema, const Value& value, const PropertyPath& path)
{
    throw TypeMismatchError(path.to_string(), std::string{kind_name(schema)},
                            std::string{type_name(value)});
}

bool scalar_matches(ScalarType type, const Value& value)
{
    switch (type) {
        case ScalarType::Bool: return value.is<bool>();
        case ScalarType::Number: return value.is<double>();
        case ScalarType::String: return value.is<std::string>();
        case ScalarType::Dynamic: return true;
    }
    return false;
}

Value keep_secret(Value result, const Value& original)
{
    result.secret = result.secret || original.secret;
    return result;
}

Value conform_collection(const SchemaNode& schema, const Value& value, const PropertyPath& path)
{
    if (schema.singleton) {
        if (!(value.is_list() || value.is_set())) {
            // Already collapsed
            return conform(*schema.elem, value, path);
        }
        const auto elems = value.elements();
        if (elems.size() > 1) {
            throw TypeMismatchError(path.to_string(), "at most one element",
                                    std::to_string(elems.size()) + " elements");
        }
        if (elems.empty()) {
            return keep_secret(Value{}, value);
        }
        return keep_secret(conform(*schema.elem, *elems[0], path), value);
    }

    if (!(value.is_list() || value.is_set())) {
        mismatch(schema, value, path);
    }
    const auto elems = value.elements();
    auto t = ValueVector{}.transient();
    for (std::size_t i = 0; i < elems.size(); ++i) {
        t.push_back(ValueBox{conform(*schema.elem, *elems[i], path.index(i))});
    }
    Value result = schema.kind == SchemaKind::Set ? Value{make_set(t.persistent())}
                                                  : Value{t.persistent()};
    return keep_secret(std::move(result), value);
}

} // anonymous namespace

Value conform(const SchemaNode& schema, const Value& value, const PropertyPath& path)
{
    if (value.is_null() || value.is_unknown()) {
        return value;
    }

    switch (schema.kind) {
        case SchemaKind::Scalar:
            if (schema.scalar != ScalarType::Dynamic && !scalar_matches(schema.scalar, value)) {
                mismatch(schema, value, path);
            }
            return value;

        case SchemaKind::List:
        case SchemaKind::Set:
            return conform_collection(schema, value, path);

        case SchemaKind::Map: {
            auto* m = value.get_if<ValueMap>();
            if (!m) {
                mismatch(schema, value, path);
            }
            auto t = m->transient();
            for (const auto& [k, v] : *m) {
                t.set(k, ValueBox{conform(*schema.elem, *v, path.key(k))});
            }
            return keep_secret(Value{t.persistent()}, value);
        }

        case SchemaKind::Block: {
            auto* m = value.get_if<ValueMap>();
            if (!m) {
                mismatch(schema, value, path);
            }
            auto t = m->transient();
            for (const auto& [k, v] : *m) {
                if (auto* field = schema.field(k)) {
                    t.set(k, ValueBox{conform(*field, *v, path.key(k))});
                }
            }
            return keep_secret(Value{t.persistent()}, value);
        }
    }
    return value;
}

const SchemaNode* lookup_schema(const SchemaNode& root, const PropertyPath& path)
{
    const SchemaNode* current = &root;
    for (const auto& seg : path) {
        current = current->collapsed();
        if (!current) return nullptr;

        if (auto* key = std::get_if<std::string>(&seg)) {
            if (current->kind == SchemaKind::Block) {
                current = current->field(*key);
            } else if (current->kind == SchemaKind::Map) {
                current = current->elem.get();
            } else {
                current = nullptr;
            }
        } else if (current->is_collection()) {
            current = current->elem.get();
        } else {
            current = nullptr;
        }

        if (!current) {
            detail::log_access_error("lookup_schema", "no schema for " + path.to_string());
            return nullptr;
        }
    }
    return current;
}

// ============================================================
// JSON schema descriptions
// ============================================================

namespace {

bool flag(const Value& desc, const std::string& name)
{
    if (!desc.contains(name)) return false;
    const Value v = desc.at(name);
    if (v.is_null()) return false;
    if (!v.is<bool>()) {
        throw SchemaError("schema flag '" + name + "' must be a bool, got " + std::string{type_name(v)});
    }
    return v.as_bool();
}

SchemaBuilder builder_from_value(const Value& desc, const std::string& where)
{
    if (!desc.is_map()) {
        throw SchemaError("schema description at " + where + " must be an object");
    }
    const std::string type = desc.at("type").as_string();

    auto elem_of = [&]() -> SchemaPtr {
        if (!desc.contains("elem")) {
            throw SchemaError(type + " schema at " + where + " has no 'elem'");
        }
        return builder_from_value(desc.at("elem"), where + ".elem").finish();
    };

    std::optional<SchemaBuilder> b;
    if (type == "bool") b = SchemaBuilder::boolean();
    else if (type == "number") b = SchemaBuilder::number();
    else if (type == "string") b = SchemaBuilder::string();
    else if (type == "dynamic") b = SchemaBuilder::dynamic();
    else if (type == "list") b = SchemaBuilder::list(elem_of());
    else if (type == "set") b = SchemaBuilder::set(elem_of());
    else if (type == "map") b = SchemaBuilder::map(elem_of());
    else if (type == "block") {
        b = SchemaBuilder::block();
        const Value fields = desc.contains("fields") ? desc.at("fields") : Value{};
        if (!fields.is_null() && !fields.is_map()) {
            throw SchemaError("'fields' at " + where + " must be an object");
        }
        for (const auto& [name, field_desc] : fields.as_map()) {
            b->field(name, builder_from_value(*field_desc, where + "." + name));
        }
    } else {
        throw SchemaError("unknown schema type '" + type + "' at " + where);
    }

    const Value max_items = desc.contains("maxItems") ? desc.at("maxItems") : Value{};
    b->singleton(flag(desc, "singleton") || (max_items.is<double>() && max_items.as_number() == 1.0))
        .required(flag(desc, "required"))
        .optional(flag(desc, "optional"))
        .computed(flag(desc, "computed"))
        .force_new(flag(desc, "forceNew"))
        .sensitive(flag(desc, "sensitive"));
    return std::move(*b);
}

} // anonymous namespace

SchemaPtr schema_from_value(const Value& description)
{
    return builder_from_value(description, "<root>").finish();
}

SchemaPtr schema_from_json(std::string_view json)
{
    return schema_from_value(from_json(json));
}

} // namespace provbridge
