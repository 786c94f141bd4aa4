// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by provbridge.
///
/// Every failure is resource-scoped: diff_resources() catches Error per
/// request, so one bad resource never stops its siblings.

#pragma once

#include <provbridge/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace provbridge {

/// Base class for all provbridge errors
class PROVBRIDGE_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid schema construction (e.g. singleton on a scalar)
class PROVBRIDGE_API SchemaError : public Error {
public:
    using Error::Error;
};

/// A value's shape contradicts its schema
class PROVBRIDGE_API TypeMismatchError : public Error {
public:
    TypeMismatchError(std::string path, const std::string& expected, const std::string& actual)
        : Error("unexpected type at field " + (path.empty() ? std::string{"<root>"} : path) +
                ": expected " + expected + ", got " + actual)
        , path_(std::move(path))
    {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Malformed property path string
class PROVBRIDGE_API PathParseError : public Error {
public:
    PathParseError(std::string text, std::size_t offset, const std::string& reason)
        : Error("invalid property path '" + text + "' at offset " +
                std::to_string(offset) + ": " + reason)
        , text_(std::move(text))
        , offset_(offset)
    {}

    /// Aggregate form used when several paths fail at once
    explicit PathParseError(const std::string& message)
        : Error(message)
    {}

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::string text_;
    std::size_t offset_ = 0;
};

/// A provider-reported field failure
struct ValidationFailure {
    std::string path;     ///< Property path in string form
    std::string message;  ///< Provider message
};

/// Failures on Required or non-Computed fields during config reconstruction
class PROVBRIDGE_API ValidationError : public Error {
public:
    explicit ValidationError(std::vector<ValidationFailure> failures);

    [[nodiscard]] const std::vector<ValidationFailure>& failures() const noexcept { return failures_; }

private:
    std::vector<ValidationFailure> failures_;
};

/// Malformed JSON handed to the state or schema codec
class PROVBRIDGE_API JsonError : public Error {
public:
    JsonError(const std::string& reason, std::size_t offset)
        : Error("JSON parse error at offset " + std::to_string(offset) + ": " + reason)
        , offset_(offset)
    {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_ = 0;
};

} // namespace provbridge
