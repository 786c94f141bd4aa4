// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/reconstruct.h>

#include <iostream>

namespace provbridge {

namespace {

void log_dropped_input(const ValidationFailure& failure)
{
#if PROVBRIDGE_VERBOSE_LOG
    std::cerr << "[reconstruct_inputs] dropping computed input '" << failure.path
              << "': " << failure.message << "\n";
#else
    (void)failure;
#endif
}

} // anonymous namespace

Value reconstruct_inputs(const SchemaNode& schema, const Value& inputs,
                         const std::vector<ValidationFailure>& failures)
{
    Value result = inputs;
    std::vector<ValidationFailure> fatal;

    for (const auto& failure : failures) {
        PropertyPath path;
        try {
            path = PropertyPath::parse(failure.path);
        } catch (const PathParseError&) {
            fatal.push_back(failure);
            continue;
        }

        const SchemaNode* node = path.empty() ? nullptr : lookup_schema(schema, path);
        if (node && node->computed && !node->required) {
            log_dropped_input(failure);
            result = erase_at_path(result, path);
        } else {
            fatal.push_back(failure);
        }
    }

    if (!fatal.empty()) {
        throw ValidationError(std::move(fatal));
    }
    return result;
}

} // namespace provbridge
