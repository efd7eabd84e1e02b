#include "internal/graph/graph_ops.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"

namespace pulse::graph {

using model::Connection;
using model::Graph;
using model::HandleKind;
using model::HandlePosition;
using model::Node;
using model::NodeKind;
using model::NodeParams;

namespace {

std::string ConnectionId(const std::string& source, const std::string& target) {
  return "edge-" + source + "-" + target;
}

std::string HandleLabel(const std::optional<std::string>& id) {
  return id.has_value() ? "'" + *id + "'" : "<default>";
}

} // namespace

Graph DefaultGraph() {
  Graph graph;
  graph.nodes.push_back(MakeNode(kDefaultStartNodeId, model::StartParams{}, {0.0, 0.0}));
  RefreshTerminalFlags(graph);
  return graph;
}

Node MakeNode(std::string id, NodeParams params, model::Point position) {
  Node node;
  node.id       = std::move(id);
  node.params   = std::move(params);
  node.position = position;

  if (node.kind() == NodeKind::kStart) {
    AttachHandle(node, HandlePosition::kRight, HandleKind::kSource, kStartOutputHandleId);
  } else {
    AttachHandle(node, HandlePosition::kLeft, HandleKind::kTarget);
    AttachHandle(node, HandlePosition::kRight, HandleKind::kSource, kOutputHandleId);
  }
  return node;
}

model::Handle AttachHandle(Node& node, HandlePosition position, HandleKind kind, std::optional<std::string> id) {
  if (node.FindHandle(kind, id) != nullptr) {
    throw util::InvalidGraph("attach handle: node '" + node.id + "' already has a handle " + HandleLabel(id) + " of this kind");
  }

  model::Handle handle;
  handle.id          = std::move(id);
  handle.kind        = kind;
  handle.position    = position;
  handle.show_button = kind == HandleKind::kSource;

  node.handles.push_back(handle);
  return handle;
}

std::optional<std::string> TerminalNodeId(const Graph& graph) {
  for (auto it = graph.nodes.rbegin(); it != graph.nodes.rend(); ++it) {
    if (!graph.HasOutgoing(it->id)) {
      return it->id;
    }
  }
  return std::nullopt;
}

void RefreshTerminalFlags(Graph& graph) {
  const auto terminal = TerminalNodeId(graph);
  for (auto& node : graph.nodes) {
    node.is_last_node = terminal.has_value() && node.id == *terminal;
  }
}

Graph AppendNode(const Graph& graph, NodeParams params, std::string new_id, double spacing_x) {
  const auto tail_id = TerminalNodeId(graph);
  if (!tail_id.has_value()) {
    throw util::InvalidGraph("append node: graph has no terminal node to extend");
  }
  if (new_id.empty()) {
    throw util::InvalidGraph("append node: node id must not be empty");
  }
  if (graph.FindNode(new_id) != nullptr) {
    throw util::InvalidGraph("append node: node id '" + new_id + "' already exists");
  }
  if (model::KindOf(params) == NodeKind::kStart) {
    throw util::InvalidGraph("append node: start nodes cannot be appended");
  }

  const Node* tail   = graph.FindNode(*tail_id);
  const auto* output = tail->FirstHandle(HandleKind::kSource);
  if (output == nullptr) {
    throw util::InvalidGraph("append node: terminal node '" + *tail_id + "' has no source handle");
  }

  Node node  = MakeNode(std::move(new_id), std::move(params), {tail->position.x + spacing_x, tail->position.y});
  auto input = node.FirstHandle(HandleKind::kTarget)->id;

  Connection connection;
  connection.id            = ConnectionId(*tail_id, node.id);
  connection.source        = *tail_id;
  connection.source_handle = output->id;
  connection.target        = node.id;
  connection.target_handle = std::move(input);

  Graph next = graph;
  next.nodes.push_back(std::move(node));
  next.connections.push_back(std::move(connection));
  RefreshTerminalFlags(next);
  return next;
}

std::vector<std::string> DownstreamOf(const Graph& graph, const std::string& node_id) {
  std::vector<std::string>        result;
  std::unordered_set<std::string> visited{node_id};
  std::deque<std::string>         queue{node_id};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();

    for (const auto& connection : graph.connections) {
      if (connection.source != current || visited.contains(connection.target)) {
        continue;
      }
      visited.insert(connection.target);
      result.push_back(connection.target);
      queue.push_back(connection.target);
    }
  }
  return result;
}

Graph RemoveNodeAndDownstream(const Graph& graph, const std::string& node_id) {
  const Node* node = graph.FindNode(node_id);
  if (node == nullptr) {
    throw util::NotFound("remove node: node '" + node_id + "' does not exist");
  }
  if (node->kind() == NodeKind::kStart) {
    throw util::InvalidGraph("remove node: the start node cannot be removed");
  }

  std::unordered_set<std::string> doomed{node_id};
  for (auto& id : DownstreamOf(graph, node_id)) {
    doomed.insert(std::move(id));
  }

  Graph next;
  for (const auto& n : graph.nodes) {
    if (!doomed.contains(n.id)) {
      next.nodes.push_back(n);
    }
  }
  for (const auto& c : graph.connections) {
    if (!doomed.contains(c.source) && !doomed.contains(c.target)) {
      next.connections.push_back(c);
    }
  }
  RefreshTerminalFlags(next);
  return next;
}

Graph ResetToStart(const Graph& graph) {
  auto it = std::find_if(graph.nodes.begin(), graph.nodes.end(), [](const Node& n) { return n.kind() == NodeKind::kStart; });
  if (it == graph.nodes.end()) {
    return DefaultGraph();
  }

  Graph next;
  next.nodes.push_back(*it);
  RefreshTerminalFlags(next);
  return next;
}

Graph UpdateNodeParams(const Graph& graph, const std::string& node_id, NodeParams params) {
  const Node* node = graph.FindNode(node_id);
  if (node == nullptr) {
    throw util::NotFound("update node: node '" + node_id + "' does not exist");
  }
  if (node->kind() != model::KindOf(params)) {
    throw util::InvalidGraph("update node: cannot change node '" + node_id + "' from " + std::string(model::KindName(node->kind())) + " to " +
                             std::string(model::KindName(model::KindOf(params))));
  }

  Graph next                    = graph;
  next.FindNode(node_id)->params = std::move(params);
  return next;
}

void ValidateGraph(const Graph& graph) {
  std::unordered_set<std::string> ids;
  std::size_t                     start_nodes = 0;

  for (const auto& node : graph.nodes) {
    if (node.id.empty()) {
      throw util::InvalidGraph("graph: node with empty id");
    }
    if (!ids.insert(node.id).second) {
      throw util::InvalidGraph("graph: duplicate node id '" + node.id + "'");
    }
    if (node.kind() == NodeKind::kStart) {
      ++start_nodes;
    }
    for (std::size_t i = 0; i < node.handles.size(); ++i) {
      for (std::size_t j = i + 1; j < node.handles.size(); ++j) {
        if (node.handles[i].kind == node.handles[j].kind && node.handles[i].id == node.handles[j].id) {
          throw util::InvalidGraph("graph: node '" + node.id + "' declares handle " + HandleLabel(node.handles[i].id) + " twice");
        }
      }
    }
  }
  if (start_nodes > 1) {
    throw util::InvalidGraph("graph: more than one start node");
  }

  std::unordered_set<std::string> connection_ids;
  for (const auto& c : graph.connections) {
    if (!connection_ids.insert(c.id).second) {
      throw util::InvalidGraph("graph: duplicate connection id '" + c.id + "'");
    }
    if (c.source == c.target) {
      throw util::InvalidGraph("graph: connection '" + c.id + "' links node '" + c.source + "' to itself");
    }

    const Node* source = graph.FindNode(c.source);
    const Node* target = graph.FindNode(c.target);
    if (source == nullptr || target == nullptr) {
      throw util::InvalidGraph("graph: connection '" + c.id + "' references a missing node");
    }
    if (source->FindHandle(HandleKind::kSource, c.source_handle) == nullptr) {
      throw util::InvalidGraph("graph: connection '" + c.id + "' leaves from unknown source handle " + HandleLabel(c.source_handle));
    }
    if (target->FindHandle(HandleKind::kTarget, c.target_handle) == nullptr) {
      throw util::InvalidGraph("graph: connection '" + c.id + "' enters unknown target handle " + HandleLabel(c.target_handle));
    }
  }
}

std::vector<std::string> ExecutionOrder(const Graph& graph) {
  std::unordered_map<std::string, std::vector<std::string>> adjacency;
  std::unordered_map<std::string, std::size_t>              in_degree;

  for (const auto& node : graph.nodes) {
    adjacency[node.id];
    in_degree[node.id] = 0;
  }
  for (const auto& c : graph.connections) {
    if (!adjacency.contains(c.source) || !adjacency.contains(c.target)) {
      continue;
    }
    adjacency[c.source].push_back(c.target);
    ++in_degree[c.target];
  }

  std::deque<std::string> queue;
  for (const auto& node : graph.nodes) {
    if (in_degree[node.id] == 0) {
      queue.push_back(node.id);
    }
  }

  std::vector<std::string> order;
  order.reserve(graph.nodes.size());
  while (!queue.empty()) {
    auto id = std::move(queue.front());
    queue.pop_front();

    for (const auto& next : adjacency[id]) {
      if (--in_degree[next] == 0) {
        queue.push_back(next);
      }
    }
    order.push_back(std::move(id));
  }

  if (order.size() != graph.nodes.size()) {
    throw util::InvalidGraph("graph: connections form a cycle; automation cannot be ordered");
  }
  return order;
}

} // namespace pulse::graph
