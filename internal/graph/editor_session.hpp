#pragma once

#include <optional>
#include <string>

#include "internal/model/graph.hpp"

namespace pulse::graph {

struct ConnectionDraft {
  std::string                source_node;
  std::optional<std::string> source_handle;
};

/*
  EditorSession

  One user's editing state over a graph. At most one connection draft
  exists per session; while it is in progress no handle in the graph shows
  its insert affordance, regardless of which node the draft started from.
*/
class EditorSession {
 public:
  explicit EditorSession(model::Graph graph);

  const model::Graph& graph() const {
    return graph_;
  }

  void BeginConnection(const std::string& node_id, const std::optional<std::string>& handle_id);

  // Validates the edge against the current graph and adds it. The draft is
  // cleared whether or not the edge is accepted.
  model::Connection CompleteConnection(const std::string& target_node_id, const std::optional<std::string>& target_handle_id);

  void CancelConnection();

  bool IsConnectionInProgress() const {
    return active_draft_.has_value();
  }

  const std::optional<ConnectionDraft>& active_draft() const {
    return active_draft_;
  }

  bool ShowsAffordance(const std::string& node_id, const std::optional<std::string>& handle_id) const;

  // Appends after the terminal node; refused while a draft is open.
  const model::Node& AppendNode(model::NodeParams params, std::string new_id, double spacing_x);

 private:
  model::Graph                   graph_;
  std::optional<ConnectionDraft> active_draft_;
};

} // namespace pulse::graph
