// node.cpp - Field decoding helpers shared by concrete node types

#include <geo_nodes/node.h>
#include <geo_nodes/errors.h>

#include <cmath>

namespace geo_nodes {
namespace detail {

double read_number(const Value& fields, std::string_view tag, const std::string& field)
{
    if (!fields.contains(field)) {
        throw MalformedFieldsError(std::string{tag}, field, "is missing");
    }
    const Value v = fields.at(field);
    if (!v.is_number()) {
        throw MalformedFieldsError(std::string{tag}, field, "is not a number");
    }
    return v.as_number();
}

NodeId read_id(const Value& fields, std::string_view tag)
{
    const std::string field = node_keys::ID;
    if (!fields.contains(field)) {
        throw MalformedFieldsError(std::string{tag}, field, "is missing");
    }
    const Value v = fields.at(field);
    if (!v.is_string()) {
        throw MalformedFieldsError(std::string{tag}, field, "is not a string");
    }
    auto id = NodeId::parse(v.as_string_view());
    if (!id) {
        throw MalformedFieldsError(std::string{tag}, field, "is not a valid uuid: " + v.as_string());
    }
    return *id;
}

Value read_map(const Value& fields, std::string_view tag, const std::string& field)
{
    if (!fields.contains(field)) {
        throw MalformedFieldsError(std::string{tag}, field, "is missing");
    }
    Value v = fields.at(field);
    if (!v.is_map()) {
        throw MalformedFieldsError(std::string{tag}, field, "is not an object");
    }
    return v;
}

void check_finite(double v, std::string_view tag, const std::string& field)
{
    if (!std::isfinite(v)) {
        throw SerializationError("field '" + field + "' of '" + std::string{tag} +
                                 "' node is not a finite number");
    }
}

} // namespace detail
} // namespace geo_nodes
