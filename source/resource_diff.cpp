// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/resource_diff.h>
#include <provbridge/differ.h>
#include <provbridge/ignore_changes.h>
#include <provbridge/replace.h>
#include <provbridge/secrets.h>

#include <iostream>

namespace provbridge {

namespace {

void log_resource_failure(const ResourceDiffRequest& request, const Error& e)
{
#if PROVBRIDGE_VERBOSE_LOG
    std::cerr << "[diff_resources] " << request.type << ": " << request.name
              << " failed: " << e.what() << "\n";
#else
    (void)request;
    (void)e;
#endif
}

} // anonymous namespace

ResourceDiff diff_resource(const ResourceDiffRequest& request)
{
    if (!request.schema) {
        throw SchemaError("no schema for resource type '" + request.type + "'");
    }
    const SchemaNode& schema = *request.schema;

    const Value old_value = conform(schema, request.old_state);
    Value new_value = conform(schema, request.new_inputs);

    if (!request.options.ignore_changes.empty() && !old_value.is_null() && !new_value.is_null()) {
        new_value = apply_ignore_changes(old_value, new_value, request.options.ignore_changes);
    }

    // Secrecy carried by the prior state applies to the new inputs too
    if (!new_value.is_null()) {
        new_value = propagate_secrets(schema, new_value, {old_value});
    }

    ResourceDiff out;
    DetailedDiffer differ{request.schema, request.options};
    out.result = differ.diff(old_value, new_value);
    resolve_replace(schema, out.result);
    if (old_value.is_null()) {
        clear_replace(out.result);
    }
    apply_replace_override(out.result, request.options.replace_override);
    annotate_secrets(schema, old_value, new_value, out.result);

    out.op = resource_op(old_value, new_value, out.result);
    out.wire = to_wire(out.result);
    out.preview = render_preview(request.type, request.name, out.op, out.result);
    return out;
}

std::vector<ResourceOutcome> diff_resources(const std::vector<ResourceDiffRequest>& requests)
{
    std::vector<ResourceOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (const auto& request : requests) {
        ResourceOutcome outcome;
        outcome.type = request.type;
        outcome.name = request.name;
        try {
            outcome.diff = diff_resource(request);
        } catch (const Error& e) {
            log_resource_failure(request, e);
            outcome.error = e.what();
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

} // namespace provbridge
