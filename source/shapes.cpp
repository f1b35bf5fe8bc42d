// shapes.cpp - Point3 and Rectangle snapshot encoding

#include <geo_nodes/shapes.h>
#include <geo_nodes/errors.h>

namespace geo_nodes {

// ============================================================
// Point3
// ============================================================

Value Point3::fields_to_value() const
{
    detail::check_finite(x_, kTypeName, "x");
    detail::check_finite(y_, kTypeName, "y");
    detail::check_finite(z_, kTypeName, "z");

    auto t = ValueMap{}.transient();
    t.set("x", ValueBox{Value{x_}});
    t.set("y", ValueBox{Value{y_}});
    t.set("z", ValueBox{Value{z_}});
    t.set(node_keys::ID, ValueBox{Value{id().to_string()}});
    return Value{t.persistent()};
}

Value Point3::to_value() const
{
    return fields_to_value().set(node_keys::TYPE, Value{std::string{kTypeName}});
}

Point3 Point3::from_fields(const Value& fields, std::string_view tag, const std::string& prefix)
{
    if (!fields.is_map()) {
        throw MalformedFieldsError(std::string{tag}, prefix.empty() ? "<node>" : prefix, "is not an object");
    }
    // Errors from an embedded point name the qualified field, e.g. "anchor.x"
    try {
        Point3 p{detail::read_id(fields, tag)};
        p.x_ = detail::read_number(fields, tag, "x");
        p.y_ = detail::read_number(fields, tag, "y");
        p.z_ = detail::read_number(fields, tag, "z");
        return p;
    } catch (const MalformedFieldsError& e) {
        if (prefix.empty()) {
            throw;
        }
        throw MalformedFieldsError(e.tag(), prefix + "." + e.field(), e.reason());
    }
}

Point3 Point3::from_value(const Value& fields)
{
    return from_fields(fields, kTypeName, "");
}

// ============================================================
// Rectangle
// ============================================================

Value Rectangle::to_value() const
{
    detail::check_finite(width_, kTypeName, "width");
    detail::check_finite(height_, kTypeName, "height");

    auto t = ValueMap{}.transient();
    t.set(node_keys::TYPE, ValueBox{Value{std::string{kTypeName}}});
    t.set("anchor", ValueBox{anchor_.fields_to_value()});
    t.set("width", ValueBox{Value{width_}});
    t.set("height", ValueBox{Value{height_}});
    t.set(node_keys::ID, ValueBox{Value{id().to_string()}});
    return Value{t.persistent()};
}

void Rectangle::set_anchor(const Point3& point) noexcept
{
    anchor_ = point;
    anchor_.adopt_id(point);
}

Rectangle Rectangle::from_value(const Value& fields)
{
    if (!fields.is_map()) {
        throw MalformedFieldsError(std::string{kTypeName}, "<node>", "is not an object");
    }

    const Value anchor = detail::read_map(fields, kTypeName, "anchor");

    Rectangle r{detail::read_id(fields, kTypeName)};
    r.set_anchor(Point3::from_fields(anchor, kTypeName, "anchor"));
    r.width_ = detail::read_number(fields, kTypeName, "width");
    r.height_ = detail::read_number(fields, kTypeName, "height");
    return r;
}

} // namespace geo_nodes
