#include "internal/model/graph.hpp"

#include <algorithm>

namespace pulse::model {

const Node* Graph::FindNode(const std::string& id) const {
  auto it = std::find_if(nodes.begin(), nodes.end(), [&](const Node& n) { return n.id == id; });
  return it == nodes.end() ? nullptr : &*it;
}

Node* Graph::FindNode(const std::string& id) {
  auto it = std::find_if(nodes.begin(), nodes.end(), [&](const Node& n) { return n.id == id; });
  return it == nodes.end() ? nullptr : &*it;
}

bool Graph::HasOutgoing(const std::string& node_id) const {
  return std::any_of(connections.begin(), connections.end(), [&](const Connection& c) { return c.source == node_id; });
}

}  // namespace pulse::model
