// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions raised by whole-collection serialization.
///
/// Absence (missing id, wrong concrete type) is never an exception: lookups
/// return nullptr. The types below abort a whole serialize/deserialize call;
/// no partially built snapshot or collection is ever returned.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace geo_nodes {

/// Base class of all geo_nodes errors
class GEO_NODES_API NodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The discriminator names no registered node type
class GEO_NODES_API UnknownVariantError : public NodeError {
public:
    explicit UnknownVariantError(std::string tag)
        : NodeError("unknown geometry node variant '" + tag + "'")
        , tag_(std::move(tag)) {}

    [[nodiscard]] const std::string& tag() const noexcept { return tag_; }

private:
    std::string tag_;
};

/// The discriminator is known (or absent) but a field is missing or mistyped
class GEO_NODES_API MalformedFieldsError : public NodeError {
public:
    MalformedFieldsError(std::string tag, std::string field, std::string reason)
        : NodeError("malformed '" + tag + "' node: field '" + field + "' " + reason)
        , tag_(std::move(tag))
        , field_(std::move(field))
        , reason_(std::move(reason)) {}

    [[nodiscard]] const std::string& tag() const noexcept { return tag_; }
    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string tag_;
    std::string field_;
    std::string reason_;
};

/// A value cannot be represented in the snapshot format (e.g. NaN)
class GEO_NODES_API SerializationError : public NodeError {
public:
    using NodeError::NodeError;
};

} // namespace geo_nodes
