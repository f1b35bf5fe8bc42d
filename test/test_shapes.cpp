// test_shapes.cpp - Tests for Point3, Rectangle and node_cast

#include <catch2/catch_all.hpp>
#include <geo_nodes/errors.h>
#include <geo_nodes/shapes.h>

#include <limits>
#include <memory>
#include <string>

using namespace geo_nodes;

// ============================================================
// Point3
// ============================================================

TEST_CASE("Point3 construction", "[shapes][point]") {
    Point3 p;
    REQUIRE(p.x() == 0.0);
    REQUIRE(p.y() == 0.0);
    REQUIRE(p.z() == 0.0);
    REQUIRE_FALSE(p.id().is_nil());
    REQUIRE(p.type_name() == "Point3");

    Point3 q{1.0, 2.0, 3.0};
    REQUIRE(q.y() == 2.0);
    REQUIRE(q.id() != p.id());
}

TEST_CASE("Point3 to_value", "[shapes][point]") {
    Point3 p{1.5, -2.0, 0.0};
    const Value v = p.to_value();

    REQUIRE(v.at("geometry_node").as_string() == "Point3");
    REQUIRE(v.at("x").as<double>() == 1.5);
    REQUIRE(v.at("y").as<double>() == -2.0);
    REQUIRE(v.at("z").is<double>());
    REQUIRE(v.at("uuid").as_string() == p.id().to_string());
    REQUIRE(v.size() == 5);

    SECTION("fields_to_value omits the discriminator") {
        const Value fields = p.fields_to_value();
        REQUIRE_FALSE(fields.contains("geometry_node"));
        REQUIRE(fields.size() == 4);
    }

    SECTION("non-finite coordinates cannot be serialized") {
        p.set_z(std::numeric_limits<double>::infinity());
        REQUIRE_THROWS_AS(p.to_value(), SerializationError);
    }
}

TEST_CASE("Point3 from_value", "[shapes][point]") {
    Point3 p{4.0, 5.0, 6.0};

    SECTION("round trip keeps id and fields") {
        Point3 q = Point3::from_value(p.to_value());
        REQUIRE(q == p);
    }

    SECTION("integer storage is accepted for coordinates") {
        Value v = p.to_value().set("x", Value{7});
        REQUIRE(Point3::from_value(v).x() == 7.0);
    }

    SECTION("missing field") {
        Value v = Value::map({{"x", Value{1.0}}, {"y", Value{1.0}}, {"uuid", Value{p.id().to_string()}}});
        try {
            (void)Point3::from_value(v);
            FAIL("expected MalformedFieldsError");
        } catch (const MalformedFieldsError& e) {
            REQUIRE(e.tag() == "Point3");
            REQUIRE(e.field() == "z");
            REQUIRE(e.reason() == "is missing");
        }
    }

    SECTION("wrong field type") {
        Value v = p.to_value().set("y", Value{"five"});
        REQUIRE_THROWS_AS(Point3::from_value(v), MalformedFieldsError);
    }

    SECTION("invalid uuid") {
        Value v = p.to_value().set("uuid", Value{"nope"});
        REQUIRE_THROWS_AS(Point3::from_value(v), MalformedFieldsError);
    }
}

// ============================================================
// Rectangle
// ============================================================

TEST_CASE("Rectangle construction and anchor", "[shapes][rectangle]") {
    Rectangle r;
    REQUIRE(r.width() == 0.0);
    REQUIRE(r.height() == 0.0);
    REQUIRE(r.anchor().x() == 0.0);
    REQUIRE(r.anchor().id() != r.id());

    SECTION("set_anchor copies the point, id included") {
        Point3 p{1.0, 2.0, 3.0};
        r.set_anchor(p);
        REQUIRE(r.anchor() == p);
        REQUIRE(r.anchor().id() == p.id());

        p.set_x(100.0);
        REQUIRE(r.anchor().x() == 1.0);
    }

    SECTION("assigning through anchor() copies coordinates but keeps the anchor id") {
        const NodeId anchor_id = r.anchor().id();
        Point3 p{1.0, 2.0, 3.0};
        r.anchor() = p;

        REQUIRE(r.anchor().id() == anchor_id);
        REQUIRE(r.anchor().x() == 1.0);
        REQUIRE(r.anchor().y() == 2.0);
        REQUIRE(r.anchor().z() == 3.0);
        REQUIRE_FALSE(r.anchor() == p);
    }

    SECTION("anchor is mutable in place") {
        r.anchor().set_y(9.0);
        REQUIRE(r.anchor().y() == 9.0);
    }
}

TEST_CASE("Rectangle to_value", "[shapes][rectangle]") {
    Rectangle r;
    r.set_width(10.0);
    r.set_height(20.0);

    const Value v = r.to_value();
    REQUIRE(v.at("geometry_node").as_string() == "Rectangle");
    REQUIRE(v.at("width").as<double>() == 10.0);
    REQUIRE(v.at("height").as<double>() == 20.0);
    REQUIRE(v.at("uuid").as_string() == r.id().to_string());

    const Value anchor = v.at("anchor");
    REQUIRE(anchor.is_map());
    REQUIRE_FALSE(anchor.contains("geometry_node"));
    REQUIRE(anchor.at("uuid").as_string() == r.anchor().id().to_string());
}

TEST_CASE("Rectangle from_value", "[shapes][rectangle]") {
    Rectangle r;
    r.set_width(3.0);
    r.set_height(4.0);
    r.anchor().set_z(-1.0);

    SECTION("round trip") {
        Rectangle s = Rectangle::from_value(r.to_value());
        REQUIRE(s.id() == r.id());
        REQUIRE(s.width() == 3.0);
        REQUIRE(s.height() == 4.0);
        REQUIRE(s.anchor() == r.anchor());
    }

    SECTION("anchor errors name the nested field") {
        Value v = r.to_value();
        v = v.set("anchor", v.at("anchor").set("x", Value{true}));
        try {
            (void)Rectangle::from_value(v);
            FAIL("expected MalformedFieldsError");
        } catch (const MalformedFieldsError& e) {
            REQUIRE(e.tag() == "Rectangle");
            REQUIRE(e.field() == "anchor.x");
        }
    }

    SECTION("anchor must be a map") {
        Value v = r.to_value().set("anchor", Value{1});
        REQUIRE_THROWS_AS(Rectangle::from_value(v), MalformedFieldsError);
    }
}

// ============================================================
// Polymorphic use
// ============================================================

TEST_CASE("node_cast narrows to the exact type", "[shapes][cast]") {
    std::unique_ptr<GeometryNode> node = std::make_unique<Point3>(1.0, 2.0, 3.0);

    REQUIRE(node_cast<Point3>(node.get()) != nullptr);
    REQUIRE(node_cast<Rectangle>(node.get()) == nullptr);
    REQUIRE(node_cast<Point3>(static_cast<GeometryNode*>(nullptr)) == nullptr);

    const GeometryNode* const_node = node.get();
    REQUIRE(node_cast<Point3>(const_node)->z() == 3.0);
}

TEST_CASE("clone keeps concrete type and id", "[shapes][clone]") {
    Rectangle r;
    r.set_width(2.0);
    const GeometryNode& node = r;

    std::unique_ptr<GeometryNode> copy = node.clone();
    REQUIRE(copy->id() == r.id());
    REQUIRE(copy->type_name() == "Rectangle");

    auto* rect = node_cast<Rectangle>(copy.get());
    REQUIRE(rect != nullptr);
    REQUIRE(rect->width() == 2.0);
    REQUIRE(rect->anchor() == r.anchor());

    rect->set_width(5.0);
    REQUIRE(r.width() == 2.0);
}
