// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_id.h
/// @brief 128-bit node identity backed by boost::uuids::uuid.
///
/// A NodeId is generated once when a node is constructed and never changes.
/// Its canonical string form ("8-4-4-4-12" lowercase hex) is the map key of
/// the node's entry in a collection snapshot.

#pragma once

#include "geo_nodes_config.h"
#include "api.h"

#include <boost/uuid/uuid.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace geo_nodes {

class GEO_NODES_API NodeId {
public:
    /// Nil identifier (all zero bits)
    NodeId() noexcept = default;

    explicit NodeId(const boost::uuids::uuid& uuid) noexcept : uuid_(uuid) {}

    /// Fresh random (version 4) identifier
    [[nodiscard]] static NodeId generate();

    [[nodiscard]] static NodeId nil() noexcept { return NodeId{}; }

    /// Parse the canonical string form; nullopt on malformed input
    [[nodiscard]] static std::optional<NodeId> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_nil() const noexcept { return uuid_.is_nil(); }

    [[nodiscard]] const boost::uuids::uuid& uuid() const noexcept { return uuid_; }

    [[nodiscard]] std::size_t hash() const noexcept;

    friend bool operator==(const NodeId& a, const NodeId& b) noexcept { return a.uuid_ == b.uuid_; }
    friend bool operator!=(const NodeId& a, const NodeId& b) noexcept { return a.uuid_ != b.uuid_; }
    friend bool operator<(const NodeId& a, const NodeId& b) noexcept { return a.uuid_ < b.uuid_; }

private:
    boost::uuids::uuid uuid_{};
};

GEO_NODES_API std::ostream& operator<<(std::ostream& os, const NodeId& id);

} // namespace geo_nodes

template <>
struct std::hash<geo_nodes::NodeId> {
    std::size_t operator()(const geo_nodes::NodeId& id) const noexcept { return id.hash(); }
};
