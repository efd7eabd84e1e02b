#include "internal/graph/editor_session.hpp"

#include <utility>

#include "internal/graph/graph_ops.hpp"
#include "internal/util/errors.hpp"

namespace pulse::graph {

using model::HandleKind;

EditorSession::EditorSession(model::Graph graph) : graph_(std::move(graph)) {
  ValidateGraph(graph_);
  RefreshTerminalFlags(graph_);
}

void EditorSession::BeginConnection(const std::string& node_id, const std::optional<std::string>& handle_id) {
  if (active_draft_) {
    throw util::InvalidState("a connection from node '" + active_draft_->source_node + "' is already in progress");
  }

  const auto* node = graph_.FindNode(node_id);
  if (node == nullptr) {
    throw util::NotFound("node not found: " + node_id);
  }
  if (node->FindHandle(HandleKind::kSource, handle_id) == nullptr) {
    throw util::NotFound("source handle not found on node " + node_id);
  }

  active_draft_ = ConnectionDraft{.source_node = node_id, .source_handle = handle_id};
}

model::Connection EditorSession::CompleteConnection(const std::string& target_node_id, const std::optional<std::string>& target_handle_id) {
  if (!active_draft_) {
    throw util::InvalidState("no connection in progress");
  }
  auto draft = std::move(*active_draft_);
  active_draft_.reset();

  model::Connection connection;
  connection.id            = "edge-" + draft.source_node + "-" + target_node_id;
  connection.source        = std::move(draft.source_node);
  connection.source_handle = std::move(draft.source_handle);
  connection.target        = target_node_id;
  connection.target_handle = target_handle_id;

  auto next = graph_;
  next.connections.push_back(connection);
  ValidateGraph(next);
  ExecutionOrder(next);  // rejects cycles
  RefreshTerminalFlags(next);

  graph_ = std::move(next);
  return connection;
}

void EditorSession::CancelConnection() {
  active_draft_.reset();
}

bool EditorSession::ShowsAffordance(const std::string& node_id, const std::optional<std::string>& handle_id) const {
  if (active_draft_) {
    return false;
  }

  const auto terminal = TerminalNodeId(graph_);
  if (!terminal || *terminal != node_id) {
    return false;
  }

  const auto* handle = graph_.FindNode(node_id)->FindHandle(HandleKind::kSource, handle_id);
  return handle != nullptr && handle->show_button;
}

const model::Node& EditorSession::AppendNode(model::NodeParams params, std::string new_id, double spacing_x) {
  if (active_draft_) {
    throw util::InvalidState("cannot append a node while a connection is in progress");
  }
  graph_ = graph::AppendNode(graph_, std::move(params), std::move(new_id), spacing_x);
  return graph_.nodes.back();
}

} // namespace pulse::graph
