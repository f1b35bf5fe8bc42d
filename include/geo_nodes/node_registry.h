// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_registry.h
/// @brief Discriminator-to-factory table used to rebuild nodes from snapshots.
///
/// A registry is an ordinary object: build one, register node types on it,
/// then treat it as read-only. NodeRegistry::builtin() holds Point3 and
/// Rectangle.
///
/// Usage:
/// @code
///   NodeRegistry registry;
///   registry.register_node<Point3>();
///   registry.register_node<MyNode>();
///   std::unique_ptr<GeometryNode> node = registry.create(entry);
/// @endcode

#pragma once

#include "api.h"
#include "node.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace geo_nodes {

class GEO_NODES_API NodeRegistry {
public:
    using Factory = std::function<std::unique_ptr<GeometryNode>(const Value&)>;

    NodeRegistry() = default;

    /// Register T under T::kTypeName. Returns false (and keeps the existing
    /// factory) if the name is already taken.
    template <RegistrableNode T>
    bool register_node() {
        return register_factory(std::string{T::kTypeName}, [](const Value& fields) -> std::unique_ptr<GeometryNode> {
            return std::make_unique<T>(T::from_value(fields));
        });
    }

    bool register_factory(std::string type_name, Factory factory);

    /// Rebuild a node from its tagged map
    /// @throws MalformedFieldsError if entry is not a map, or the tag is
    ///         missing or not a string, or the fields do not decode
    /// @throws UnknownVariantError if the tag names no registered type
    [[nodiscard]] std::unique_ptr<GeometryNode> create(const Value& entry) const;

    [[nodiscard]] bool contains(std::string_view type_name) const;

    /// Registered names in ascending order
    [[nodiscard]] std::vector<std::string> type_names() const;

    [[nodiscard]] std::size_t size() const noexcept { return factories_.size(); }

    /// Shared registry holding the built-in node types
    [[nodiscard]] static const NodeRegistry& builtin();

private:
    std::map<std::string, Factory, std::less<>> factories_;
};

} // namespace geo_nodes
