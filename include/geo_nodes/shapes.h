// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file shapes.h
/// @brief Built-in geometry node types: Point3 and Rectangle.
///
/// Snapshot layout:
/// @code
///   Point3:    {"geometry_node": "Point3", "x": 0.0, "y": 0.0, "z": 0.0, "uuid": "..."}
///   Rectangle: {"geometry_node": "Rectangle",
///               "anchor": {"x": 0.0, "y": 0.0, "z": 0.0, "uuid": "..."},
///               "width": 0.0, "height": 0.0, "uuid": "..."}
/// @endcode
///
/// The Rectangle's anchor is embedded by value and carries no discriminator.
///
/// Assigning one node to another copies its fields and keeps the target's id.
/// Rectangle::set_anchor() is the one place a point takes over another's id.

#pragma once

#include "api.h"
#include "node.h"

#include <string_view>

namespace geo_nodes {

class GEO_NODES_API Point3 final : public NodeBase<Point3> {
public:
    static constexpr std::string_view kTypeName = "Point3";

    /// Origin with a fresh id
    Point3() = default;
    Point3(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    [[nodiscard]] double x() const noexcept { return x_; }
    [[nodiscard]] double y() const noexcept { return y_; }
    [[nodiscard]] double z() const noexcept { return z_; }

    void set_x(double v) noexcept { x_ = v; }
    void set_y(double v) noexcept { y_ = v; }
    void set_z(double v) noexcept { z_ = v; }

    [[nodiscard]] Value to_value() const override;

    /// Fields without the discriminator (used when embedded in another node)
    [[nodiscard]] Value fields_to_value() const;

    /// Rebuild from fields; the discriminator, if present, is ignored
    /// @throws MalformedFieldsError
    [[nodiscard]] static Point3 from_value(const Value& fields);

    bool operator==(const Point3& other) const noexcept {
        return id() == other.id() && x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }

private:
    explicit Point3(NodeId id) noexcept : NodeBase(id) {}

    static Point3 from_fields(const Value& fields, std::string_view tag, const std::string& prefix);

    friend class Rectangle;

    double x_ = 0.0;
    double y_ = 0.0;
    double z_ = 0.0;
};

class GEO_NODES_API Rectangle final : public NodeBase<Rectangle> {
public:
    static constexpr std::string_view kTypeName = "Rectangle";

    /// Zero-sized rectangle anchored at a fresh origin point
    Rectangle() = default;

    [[nodiscard]] const Point3& anchor() const noexcept { return anchor_; }
    [[nodiscard]] Point3& anchor() noexcept { return anchor_; }

    /// Replace the anchor with a copy of point, id included
    void set_anchor(const Point3& point) noexcept;

    [[nodiscard]] double width() const noexcept { return width_; }
    [[nodiscard]] double height() const noexcept { return height_; }

    void set_width(double v) noexcept { width_ = v; }
    void set_height(double v) noexcept { height_ = v; }

    [[nodiscard]] Value to_value() const override;

    /// @throws MalformedFieldsError
    [[nodiscard]] static Rectangle from_value(const Value& fields);

private:
    explicit Rectangle(NodeId id) noexcept : NodeBase(id) {}

    Point3 anchor_;
    double width_ = 0.0;
    double height_ = 0.0;
};

} // namespace geo_nodes
