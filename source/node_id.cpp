// node_id.cpp - NodeId generation, parsing and formatting

#include <geo_nodes/node_id.h>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <stdexcept>

namespace geo_nodes {

NodeId NodeId::generate()
{
    // One generator per thread: construction seeds from the OS entropy source
    thread_local boost::uuids::random_generator generator;
    return NodeId{generator()};
}

std::optional<NodeId> NodeId::parse(std::string_view text)
{
    // Only the 36-character hyphenated form is accepted; hex digits may be
    // either case, to_string() always yields lowercase
    if (text.size() != 36) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return std::nullopt;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    try {
        boost::uuids::string_generator gen;
        return NodeId{gen(text.begin(), text.end())};
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::string NodeId::to_string() const
{
    return boost::uuids::to_string(uuid_);
}

std::size_t NodeId::hash() const noexcept
{
    return boost::uuids::hash_value(uuid_);
}

std::ostream& operator<<(std::ostream& os, const NodeId& id)
{
    return os << id.to_string();
}

} // namespace geo_nodes
