#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/graph.hpp"

namespace pulse::graph {

inline constexpr const char* kDefaultStartNodeId   = "start-1";
inline constexpr const char* kStartOutputHandleId  = "start-output";
inline constexpr const char* kOutputHandleId       = "output";
inline constexpr double      kDefaultNodeSpacingX  = 250.0;

/*
  Structural operations on automation graphs.

  Every mutating operation takes the graph by const reference and returns
  the new graph. Structural errors throw util::InvalidGraph before anything
  is built, so a caller's graph is never left half-updated.
*/

// One start node, terminal, at the origin.
model::Graph DefaultGraph();

// Builds a node with its default handles: start nodes get a single source
// handle "start-output"; every other kind gets an unnamed target handle on
// the left and a source handle "output" on the right.
model::Node MakeNode(std::string id, model::NodeParams params, model::Point position);

model::Handle AttachHandle(model::Node& node, model::HandlePosition position, model::HandleKind kind,
                           std::optional<std::string> id = std::nullopt);

// Last node, in node order, without an outgoing connection. Appended nodes
// go to the back, so the most recent append is always terminal.
std::optional<std::string> TerminalNodeId(const model::Graph& graph);

// Marks exactly the terminal node as last; clears the flag everywhere else.
void RefreshTerminalFlags(model::Graph& graph);

model::Graph AppendNode(const model::Graph& graph, model::NodeParams params, std::string new_id,
                        double spacing_x = kDefaultNodeSpacingX);

// Node ids reachable from node_id along outgoing connections (excluding it).
std::vector<std::string> DownstreamOf(const model::Graph& graph, const std::string& node_id);

model::Graph RemoveNodeAndDownstream(const model::Graph& graph, const std::string& node_id);

// Keeps the first start node (creating one if none exists) and drops
// every connection.
model::Graph ResetToStart(const model::Graph& graph);

// Replaces a node's parameters. The node kind may not change.
model::Graph UpdateNodeParams(const model::Graph& graph, const std::string& node_id, model::NodeParams params);

void ValidateGraph(const model::Graph& graph);

// Kahn order over connections. A cycle is an InvalidGraph error.
std::vector<std::string> ExecutionOrder(const model::Graph& graph);

} // namespace pulse::graph
