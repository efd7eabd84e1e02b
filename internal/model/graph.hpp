#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/node.hpp"

namespace pulse::model {

// Directed link from one node's source handle to another node's target handle.
struct Connection {
  std::string                id;
  std::string                source;
  std::optional<std::string> source_handle;
  std::string                target;
  std::optional<std::string> target_handle;
};

/*
  An automation's structural state.

  Nodes and connections have no lifecycle outside the graph; the graph
  itself is owned by the automation record.
*/
struct Graph {
  std::vector<Node>       nodes;
  std::vector<Connection> connections;

  const Node* FindNode(const std::string& id) const;
  Node*       FindNode(const std::string& id);

  bool HasOutgoing(const std::string& node_id) const;
};

}  // namespace pulse::model
