// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_collection.h
/// @brief Identity-keyed owner of polymorphic geometry nodes.
///
/// Each node is stored under its own id(); pushing a node whose id is already
/// present replaces the old node. Lookups narrow to the exact concrete type
/// and return nullptr when the id is absent or the type does not match.
///
/// Usage:
/// @code
///   NodeCollection nodes;
///   auto rect = std::make_unique<Rectangle>();
///   const NodeId rect_id = rect->id();
///   nodes.push(std::move(rect));
///
///   if (Rectangle* r = nodes.get_typed_mut<Rectangle>(rect_id)) {
///       r->set_width(10.0);
///   }
///   Value snapshot = nodes.to_value();
///   NodeCollection copy = NodeCollection::from_value(snapshot, NodeRegistry::builtin());
/// @endcode

#pragma once

#include "api.h"
#include "node.h"
#include "node_id.h"
#include "node_registry.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace geo_nodes {

class GEO_NODES_API NodeCollection {
public:
    NodeCollection() = default;
    NodeCollection(NodeCollection&&) noexcept = default;
    NodeCollection& operator=(NodeCollection&&) noexcept = default;

    NodeCollection(const NodeCollection&) = delete;
    NodeCollection& operator=(const NodeCollection&) = delete;

    /// Insert under node->id(), replacing any node with the same id.
    /// A null pointer is ignored.
    void push(std::unique_ptr<GeometryNode> node);

    /// Take the node out of the collection; null if id is absent
    std::unique_ptr<GeometryNode> remove(const NodeId& id);

    [[nodiscard]] const GeometryNode* get(const NodeId& id) const;
    [[nodiscard]] GeometryNode* get(const NodeId& id);

    template <typename T>
    [[nodiscard]] const T* get_typed(const NodeId& id) const {
        return node_cast<T>(get(id));
    }

    template <typename T>
    [[nodiscard]] T* get_typed_mut(const NodeId& id) {
        return node_cast<T>(get(id));
    }

    [[nodiscard]] bool contains(const NodeId& id) const { return nodes_.count(id) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    void clear() { nodes_.clear(); }

    /// Ids in ascending order
    [[nodiscard]] std::vector<NodeId> ids() const;

    /// Visit nodes in ascending id order
    void for_each(const std::function<void(const GeometryNode&)>& fn) const;

    /// Deep copy; nodes keep their ids
    [[nodiscard]] NodeCollection clone() const;

    /// Snapshot: {"<uuid>": <tagged node map>, ...}
    /// @throws SerializationError if any node holds a non-finite number
    [[nodiscard]] Value to_value() const;

    /// Rebuild a collection from a snapshot. Either every entry decodes or
    /// the first error is thrown.
    /// @throws MalformedFieldsError, UnknownVariantError
    [[nodiscard]] static NodeCollection from_value(const Value& snapshot,
                                                   const NodeRegistry& registry = NodeRegistry::builtin());

    /// to_value() rendered as JSON text
    [[nodiscard]] std::string to_json(bool compact = false) const;

    /// @throws MalformedFieldsError if text is not valid JSON, plus from_value() errors
    [[nodiscard]] static NodeCollection from_json(const std::string& text,
                                                  const NodeRegistry& registry = NodeRegistry::builtin());

private:
    std::unordered_map<NodeId, std::unique_ptr<GeometryNode>> nodes_;
};

} // namespace geo_nodes
