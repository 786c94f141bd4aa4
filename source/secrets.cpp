// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file secrets.cpp
/// @brief Secret propagation, entry annotation and the state sentinel codec.

#include <provbridge/secrets.h>
#include <provbridge/builders.h>
#include <provbridge/value_hash.h>

#include <lager/lenses.hpp>

namespace provbridge {

namespace {

/// Sensitivity of a node; singleton wrappers count with their element
bool is_sensitive(const SchemaNode* schema)
{
    while (schema) {
        if (schema->sensitive) return true;
        if (!schema->singleton) break;
        schema = schema->elem.get();
    }
    return false;
}

const SchemaNode* child_schema(const SchemaNode* schema, const PathSegment& seg)
{
    if (!schema) return nullptr;
    const SchemaNode* node = schema->collapsed();
    if (!node) return nullptr;
    if (std::holds_alternative<std::string>(seg)) {
        if (node->kind == SchemaKind::Block) return node->field(std::get<std::string>(seg));
        if (node->kind == SchemaKind::Map) return node->elem.get();
        return nullptr;
    }
    return node->is_collection() ? node->elem.get() : nullptr;
}

Value propagate(const SchemaNode* schema, const Value& target, const std::vector<const Value*>& sources)
{
    if (target.is_null()) {
        return target;
    }

    bool secret = target.secret || is_sensitive(schema);
    for (const Value* source : sources) {
        if (!source) continue;
        if (source->secret) secret = true;
        if (target.is_set() && contains_secret(*source)) secret = true;
    }
    if (secret) {
        return target.with_secret(true);
    }

    if (auto* m = target.get_if<ValueMap>()) {
        auto t = m->transient();
        for (const auto& [key, child] : *m) {
            std::vector<const Value*> child_sources;
            child_sources.reserve(sources.size());
            for (const Value* source : sources) {
                const ValueBox* found = nullptr;
                if (source) {
                    if (auto* sm = source->get_if<ValueMap>()) found = sm->find(key);
                }
                child_sources.push_back(found ? &found->get() : nullptr);
            }
            const PathSegment seg{key};
            t.set(key, ValueBox{propagate(child_schema(schema, seg), *child, child_sources)});
        }
        Value result{t.persistent()};
        return result;
    }

    if (auto* vec = target.get_if<ValueVector>()) {
        auto t = ValueVector{}.transient();
        for (std::size_t i = 0; i < vec->size(); ++i) {
            std::vector<const Value*> child_sources;
            child_sources.reserve(sources.size());
            for (const Value* source : sources) {
                const Value* elem = nullptr;
                if (source) {
                    if (auto* sv = source->get_if<ValueVector>(); sv && i < sv->size()) {
                        elem = &(*sv)[i].get();
                    }
                }
                child_sources.push_back(elem);
            }
            const PathSegment seg{i};
            t.push_back(ValueBox{propagate(child_schema(schema, seg), *(*vec)[i], child_sources)});
        }
        return Value{t.persistent()};
    }

    if (auto* set = target.get_if<ValueSet>()) {
        // Only the element schema can mark elements here
        const SchemaNode* elem = child_schema(schema, PathSegment{std::size_t{0}});
        auto t = ValueVector{}.transient();
        for (const auto& box : set->elements) {
            t.push_back(ValueBox{propagate(elem, *box, {})});
        }
        return Value{make_set(t.persistent())};
    }

    return target;
}

Value wrap(const Value& value)
{
    return ObjectBuilder()
        .set(std::string{kSecretSigKey}, std::string{kSecretSigValue})
        .set("value", strip_secrets(value))
        .finish();
}

} // anonymous namespace

Value propagate_secrets(const SchemaNode& schema, const Value& target, const std::vector<Value>& sources)
{
    std::vector<const Value*> ptrs;
    ptrs.reserve(sources.size());
    for (const auto& source : sources) {
        ptrs.push_back(&source);
    }
    return propagate(&schema, target, ptrs);
}

bool is_secret_sentinel(const Value& value)
{
    auto* m = value.get_if<ValueMap>();
    if (!m || m->size() != 2) {
        return false;
    }
    auto* sig = m->find(std::string{kSecretSigKey});
    if (!sig || m->count("value") == 0) {
        return false;
    }
    auto* sig_str = sig->get().get_if<std::string>();
    return sig_str && *sig_str == kSecretSigValue;
}

Value encode_state(const Value& value)
{
    if (value.secret) {
        return wrap(value);
    }
    if (!contains_secret(value)) {
        return value;
    }
    if (auto* m = value.get_if<ValueMap>()) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, child] : *m) {
            t.set(key, ValueBox{encode_state(*child)});
        }
        return Value{t.persistent()};
    }
    if (auto* vec = value.get_if<ValueVector>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : *vec) {
            t.push_back(ValueBox{encode_state(*box)});
        }
        return Value{t.persistent()};
    }
    if (auto* set = value.get_if<ValueSet>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : set->elements) {
            t.push_back(ValueBox{encode_state(*box)});
        }
        return Value{make_set(t.persistent())};
    }
    return value;
}

Value decode_state(const Value& value)
{
    if (is_secret_sentinel(value)) {
        return decode_state(value.at("value")).with_secret(true);
    }
    if (auto* m = value.get_if<ValueMap>()) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, child] : *m) {
            t.set(key, ValueBox{decode_state(*child)});
        }
        Value result{t.persistent()};
        result.secret = value.secret;
        return result;
    }
    if (auto* vec = value.get_if<ValueVector>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : *vec) {
            t.push_back(ValueBox{decode_state(*box)});
        }
        Value result{t.persistent()};
        result.secret = value.secret;
        return result;
    }
    if (auto* set = value.get_if<ValueSet>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : set->elements) {
            t.push_back(ValueBox{decode_state(*box)});
        }
        Value result{make_set(t.persistent())};
        result.secret = value.secret;
        return result;
    }
    return value;
}

Value persist_state(const SchemaNode& schema, const Value& outputs, const std::vector<Value>& sources)
{
    return encode_state(propagate_secrets(schema, outputs, sources));
}

void annotate_secrets(const SchemaNode& schema, const Value& old_value, const Value& new_value,
                      DiffResult& result)
{
    for (auto& [path, entry] : result.entries) {
        bool secret = contains_secret(entry.old_value) || contains_secret(entry.new_value) ||
                      is_sensitive(&schema) || old_value.secret || new_value.secret;

        const SchemaNode* node = &schema;
        for (std::size_t depth = 1; depth <= path.size() && !secret; ++depth) {
            node = child_schema(node, path[depth - 1]);
            const PropertyPath prefix = path.prefix(depth);
            const ValueLens lens = path_lens(prefix);
            secret = is_sensitive(node) ||
                     lager::view(lens, old_value).secret ||
                     lager::view(lens, new_value).secret;
        }
        entry.secret = secret;
    }
}

} // namespace provbridge
