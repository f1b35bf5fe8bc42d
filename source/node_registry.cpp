// node_registry.cpp - Tagged node factories

#include <geo_nodes/node_registry.h>
#include <geo_nodes/errors.h>
#include <geo_nodes/shapes.h>

namespace geo_nodes {

bool NodeRegistry::register_factory(std::string type_name, Factory factory)
{
    if (factories_.count(type_name) > 0) {
        detail::log_key_error("NodeRegistry::register_factory", type_name, "is already registered");
        return false;
    }
    factories_.emplace(std::move(type_name), std::move(factory));
    return true;
}

std::unique_ptr<GeometryNode> NodeRegistry::create(const Value& entry) const
{
    const std::string type_field = node_keys::TYPE;
    if (!entry.is_map()) {
        throw MalformedFieldsError("<unknown>", "<node>", "is not an object");
    }
    if (!entry.contains(type_field)) {
        throw MalformedFieldsError("<unknown>", type_field, "is missing");
    }
    const Value tag = entry.at(type_field);
    if (!tag.is_string()) {
        throw MalformedFieldsError("<unknown>", type_field, "is not a string");
    }

    auto it = factories_.find(tag.as_string_view());
    if (it == factories_.end()) {
        throw UnknownVariantError(tag.as_string());
    }
    return it->second(entry);
}

bool NodeRegistry::contains(std::string_view type_name) const
{
    return factories_.find(type_name) != factories_.end();
}

std::vector<std::string> NodeRegistry::type_names() const
{
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

const NodeRegistry& NodeRegistry::builtin()
{
    static const NodeRegistry registry = [] {
        NodeRegistry r;
        r.register_node<Point3>();
        r.register_node<Rectangle>();
        return r;
    }();
    return registry;
}

} // namespace geo_nodes
