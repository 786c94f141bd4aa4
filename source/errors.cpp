// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <provbridge/errors.h>

namespace provbridge {

namespace {

std::string describe(const std::vector<ValidationFailure>& failures)
{
    std::string msg = std::to_string(failures.size()) +
                      (failures.size() == 1 ? " validation failure" : " validation failures");
    for (std::size_t i = 0; i < failures.size(); ++i) {
        msg += i == 0 ? ": " : "; ";
        msg += failures[i].path.empty() ? std::string{"<root>"} : failures[i].path;
        msg += ": ";
        msg += failures[i].message;
    }
    return msg;
}

} // anonymous namespace

ValidationError::ValidationError(std::vector<ValidationFailure> failures)
    : Error(describe(failures))
    , failures_(std::move(failures))
{}

} // namespace provbridge
