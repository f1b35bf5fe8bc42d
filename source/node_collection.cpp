// node_collection.cpp - NodeCollection storage and snapshot conversion

#include <geo_nodes/node_collection.h>
#include <geo_nodes/errors.h>
#include <geo_nodes/serialization.h>

#include <algorithm>

namespace geo_nodes {

void NodeCollection::push(std::unique_ptr<GeometryNode> node)
{
    if (!node) {
        detail::log_access_error("NodeCollection::push", "ignoring null node");
        return;
    }
    const NodeId id = node->id();
    auto [it, inserted] = nodes_.try_emplace(id, nullptr);
    if (!inserted) {
        detail::log_key_error("NodeCollection::push", id.to_string(), "already present, replacing");
    }
    it->second = std::move(node);
}

std::unique_ptr<GeometryNode> NodeCollection::remove(const NodeId& id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        detail::log_key_error("NodeCollection::remove", id.to_string(), "not found");
        return nullptr;
    }
    std::unique_ptr<GeometryNode> node = std::move(it->second);
    nodes_.erase(it);
    return node;
}

const GeometryNode* NodeCollection::get(const NodeId& id) const
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

GeometryNode* NodeCollection::get(const NodeId& id)
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

std::vector<NodeId> NodeCollection::ids() const
{
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void NodeCollection::for_each(const std::function<void(const GeometryNode&)>& fn) const
{
    for (const auto& id : ids()) {
        fn(*nodes_.at(id));
    }
}

NodeCollection NodeCollection::clone() const
{
    NodeCollection copy;
    copy.nodes_.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        copy.nodes_.emplace(id, node->clone());
    }
    return copy;
}

Value NodeCollection::to_value() const
{
    // Build into a transient; a throwing node leaves no snapshot behind
    auto t = ValueMap{}.transient();
    for (const auto& [id, node] : nodes_) {
        t.set(id.to_string(), ValueBox{node->to_value()});
    }
    return Value{t.persistent()};
}

NodeCollection NodeCollection::from_value(const Value& snapshot, const NodeRegistry& registry)
{
    if (!snapshot.is_map()) {
        throw MalformedFieldsError("<snapshot>", "<root>", "is not an object");
    }

    NodeCollection result;
    for (const auto& key : snapshot.keys()) {
        auto key_id = NodeId::parse(key);
        if (!key_id) {
            throw MalformedFieldsError("<snapshot>", key, "is not a valid uuid key");
        }

        std::unique_ptr<GeometryNode> node = registry.create(snapshot.at(key));
        if (node->id() != *key_id) {
            throw MalformedFieldsError(std::string{node->type_name()}, node_keys::ID,
                                       "does not match its snapshot key " + key);
        }
        // Keys differing only in hex case name the same id
        if (!result.nodes_.emplace(*key_id, std::move(node)).second) {
            throw MalformedFieldsError("<snapshot>", key, "names the same id as another key");
        }
    }
    return result;
}

std::string NodeCollection::to_json(bool compact) const
{
    return geo_nodes::to_json(to_value(), compact);
}

NodeCollection NodeCollection::from_json(const std::string& text, const NodeRegistry& registry)
{
    std::string error;
    Value snapshot = geo_nodes::from_json(text, &error);
    if (!error.empty()) {
        throw MalformedFieldsError("<snapshot>", "<json>", "could not be parsed: " + error);
    }
    return from_value(snapshot, registry);
}

} // namespace geo_nodes
