// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief GeometryNode interface, safe narrowing and field decoding helpers.
///
/// Every concrete node type:
/// - reports a stable NodeId that never changes after construction
/// - serializes to a tagged map: {"geometry_node": <type name>, ...fields, "uuid": <id>}
/// - can be rebuilt from that map by a NodeRegistry without the caller naming the type
///
/// Concrete types normally derive from NodeBase<Derived>, which supplies the
/// identity, the type name and clone().
///
/// Usage:
/// @code
///   std::unique_ptr<GeometryNode> node = std::make_unique<Point3>();
///   if (Point3* p = node_cast<Point3>(node.get())) {
///       p->set_x(1.0);
///   }
/// @endcode

#pragma once

#include "api.h"
#include "node_id.h"
#include "value.h"

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>

namespace geo_nodes {

/// Snapshot keys shared by all node types
namespace node_keys {
    inline constexpr const char* TYPE = "geometry_node";
    inline constexpr const char* ID   = "uuid";
}

class GEO_NODES_API GeometryNode {
public:
    virtual ~GeometryNode() = default;

    /// Identity assigned at construction
    [[nodiscard]] virtual NodeId id() const noexcept = 0;

    /// Registered discriminator of the concrete type
    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    /// Tagged representation (discriminator, fields and "uuid")
    /// @throws SerializationError if a field cannot be represented
    [[nodiscard]] virtual Value to_value() const = 0;

    /// Deep copy preserving concrete type and identity
    [[nodiscard]] virtual std::unique_ptr<GeometryNode> clone() const = 0;

protected:
    GeometryNode() = default;
    GeometryNode(const GeometryNode&) = default;
    GeometryNode& operator=(const GeometryNode&) = default;
};

/// Requirements for a type that can be registered in a NodeRegistry
template <typename T>
concept RegistrableNode = std::derived_from<T, GeometryNode> &&
    requires(const Value& v) {
        { T::kTypeName } -> std::convertible_to<std::string_view>;
        { T::from_value(v) } -> std::same_as<T>;
    };

// ============================================================
// Safe narrowing
//
// Succeeds only when the dynamic type is exactly T; a subclass of T or any
// other node type yields nullptr.
// ============================================================

template <typename T>
[[nodiscard]] T* node_cast(GeometryNode* node) noexcept
{
    if (node == nullptr || typeid(*node) != typeid(T)) {
        return nullptr;
    }
    return static_cast<T*>(node);
}

template <typename T>
[[nodiscard]] const T* node_cast(const GeometryNode* node) noexcept
{
    if (node == nullptr || typeid(*node) != typeid(T)) {
        return nullptr;
    }
    return static_cast<const T*>(node);
}

// ============================================================
// NodeBase - identity, type name and clone() for concrete nodes
// ============================================================

template <typename Derived>
class NodeBase : public GeometryNode {
public:
    [[nodiscard]] NodeId id() const noexcept override { return id_; }

    [[nodiscard]] std::string_view type_name() const noexcept override { return Derived::kTypeName; }

    [[nodiscard]] std::unique_ptr<GeometryNode> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

protected:
    NodeBase() : id_(NodeId::generate()) {}
    explicit NodeBase(NodeId id) noexcept : id_(id) {}

    // Copies carry the source's id; assignment replaces state but a node
    // never changes identity that way
    NodeBase(const NodeBase&) = default;
    NodeBase& operator=(const NodeBase&) noexcept { return *this; }

    void adopt_id(const NodeBase& other) noexcept { id_ = other.id_; }

private:
    NodeId id_;
};

// ============================================================
// Field decoding helpers used by from_value() implementations
//
// All of them throw MalformedFieldsError naming the type tag and field.
// ============================================================

namespace detail {

/// Numeric field (int64 or double storage accepted)
[[nodiscard]] GEO_NODES_API double read_number(const Value& fields, std::string_view tag, const std::string& field);

/// "uuid" field in canonical string form
[[nodiscard]] GEO_NODES_API NodeId read_id(const Value& fields, std::string_view tag);

/// Nested map field
[[nodiscard]] GEO_NODES_API Value read_map(const Value& fields, std::string_view tag, const std::string& field);

/// Throws SerializationError if v is NaN or infinite
GEO_NODES_API void check_finite(double v, std::string_view tag, const std::string& field);

} // namespace detail

} // namespace geo_nodes
