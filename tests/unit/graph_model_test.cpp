#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/graph/graph_ops.hpp"
#include "internal/util/errors.hpp"

namespace {

using pulse::graph::AppendNode;
using pulse::graph::DefaultGraph;
using pulse::model::Graph;
using pulse::model::HandleKind;
using pulse::model::NodeKind;

pulse::model::NodeParams Transfer(const std::string& to) {
  return pulse::model::TransferParams{.token = "0xtoken", .to = to, .amount = pulse::model::StaticAmount{"1"}};
}

pulse::model::NodeParams Wait(std::uint32_t seconds) {
  return pulse::model::WaitParams{.seconds = seconds};
}

std::size_t CountLast(const Graph& graph) {
  std::size_t count = 0;
  for (const auto& node : graph.nodes) {
    if (node.is_last_node) {
      ++count;
    }
  }
  return count;
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestDefaultGraphHasTerminalStart() {
  const auto graph = DefaultGraph();
  assert(graph.nodes.size() == 1);
  assert(graph.connections.empty());

  const auto& start = graph.nodes.front();
  assert(start.id == pulse::graph::kDefaultStartNodeId);
  assert(start.kind() == NodeKind::kStart);
  assert(start.is_last_node);
  assert(start.handles.size() == 1);
  assert(start.handles[0].kind == HandleKind::kSource);
  assert(start.handles[0].id == std::string(pulse::graph::kStartOutputHandleId));
  assert(start.handles[0].show_button);
}

void TestAppendLinksFromTerminalAndMovesLastFlag() {
  auto graph = DefaultGraph();
  graph      = AppendNode(graph, Transfer("0xa"), "transfer-1");
  graph      = AppendNode(graph, Wait(5), "wait-1");

  assert(graph.nodes.size() == 3);
  assert(graph.connections.size() == 2);
  assert(CountLast(graph) == 1);
  assert(graph.FindNode("wait-1")->is_last_node);
  assert(!graph.FindNode("transfer-1")->is_last_node);

  const auto& first = graph.connections[0];
  assert(first.id == "edge-start-1-transfer-1");
  assert(first.source == "start-1");
  assert(first.source_handle == std::string("start-output"));
  assert(first.target == "transfer-1");
  assert(!first.target_handle.has_value());

  const auto& second = graph.connections[1];
  assert(second.source == "transfer-1");
  assert(second.source_handle == std::string(pulse::graph::kOutputHandleId));

  const auto* appended = graph.FindNode("wait-1");
  assert(appended->position.x == 2 * pulse::graph::kDefaultNodeSpacingX);
  assert(appended->position.y == 0.0);
}

void TestAppendKeepsInputUntouched() {
  const auto before = DefaultGraph();
  const auto after  = AppendNode(before, Transfer("0xa"), "transfer-1", 100.0);

  assert(before.nodes.size() == 1);
  assert(before.nodes[0].is_last_node);
  assert(after.FindNode("transfer-1")->position.x == 100.0);
}

void TestAppendRejectsBadInputs() {
  const auto graph = AppendNode(DefaultGraph(), Transfer("0xa"), "transfer-1");

  assert(Throws<pulse::util::InvalidGraph>([&] { AppendNode(graph, Wait(1), "transfer-1"); }));
  assert(Throws<pulse::util::InvalidGraph>([&] { AppendNode(graph, Wait(1), ""); }));
  assert(Throws<pulse::util::InvalidGraph>([&] { AppendNode(graph, pulse::model::StartParams{}, "start-2"); }));
  assert(Throws<pulse::util::InvalidGraph>([&] { AppendNode(Graph{}, Wait(1), "wait-1"); }));
  assert(graph.nodes.size() == 2);
}

void TestRemoveDropsDownstream() {
  auto graph = DefaultGraph();
  graph      = AppendNode(graph, Transfer("0xa"), "a");
  graph      = AppendNode(graph, Wait(1), "b");
  graph      = AppendNode(graph, Wait(2), "c");

  const auto downstream = pulse::graph::DownstreamOf(graph, "a");
  assert((downstream == std::vector<std::string>{"b", "c"}));

  const auto trimmed = pulse::graph::RemoveNodeAndDownstream(graph, "b");
  assert(trimmed.nodes.size() == 2);
  assert(trimmed.connections.size() == 1);
  assert(trimmed.FindNode("a")->is_last_node);
  assert(CountLast(trimmed) == 1);

  assert(Throws<pulse::util::NotFound>([&] { pulse::graph::RemoveNodeAndDownstream(graph, "missing"); }));
  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::RemoveNodeAndDownstream(graph, "start-1"); }));
}

void TestResetKeepsOnlyStart() {
  auto graph = AppendNode(DefaultGraph(), Transfer("0xa"), "a");
  graph.nodes.front().position = {40.0, 12.0};

  const auto reset = pulse::graph::ResetToStart(graph);
  assert(reset.nodes.size() == 1);
  assert(reset.connections.empty());
  assert(reset.nodes[0].id == "start-1");
  assert(reset.nodes[0].position.x == 40.0);
  assert(reset.nodes[0].is_last_node);

  const auto from_empty = pulse::graph::ResetToStart(Graph{});
  assert(from_empty.nodes.size() == 1);
  assert(from_empty.nodes[0].kind() == NodeKind::kStart);
}

void TestUpdateParamsKeepsKind() {
  const auto graph   = AppendNode(DefaultGraph(), Transfer("0xa"), "a");
  const auto updated = pulse::graph::UpdateNodeParams(graph, "a", Transfer("0xb"));
  assert(std::get<pulse::model::TransferParams>(updated.FindNode("a")->params).to == "0xb");
  assert(std::get<pulse::model::TransferParams>(graph.FindNode("a")->params).to == "0xa");

  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::UpdateNodeParams(graph, "a", Wait(3)); }));
  assert(Throws<pulse::util::NotFound>([&] { pulse::graph::UpdateNodeParams(graph, "zzz", Wait(3)); }));
}

void TestExecutionOrderFollowsConnections() {
  auto graph = DefaultGraph();
  graph      = AppendNode(graph, Transfer("0xa"), "a");
  graph      = AppendNode(graph, Wait(1), "b");

  // declared out of order; execution still follows the edges
  std::swap(graph.nodes[0], graph.nodes[2]);
  const auto order = pulse::graph::ExecutionOrder(graph);
  assert((order == std::vector<std::string>{"start-1", "a", "b"}));
}

void TestValidateRejectsCyclesAndDanglingEdges() {
  auto graph = DefaultGraph();
  graph      = AppendNode(graph, Transfer("0xa"), "a");
  graph      = AppendNode(graph, Wait(1), "b");

  auto cyclic = graph;
  cyclic.connections.push_back({.id = "edge-b-a", .source = "b", .source_handle = "output", .target = "a", .target_handle = std::nullopt});
  pulse::graph::ValidateGraph(cyclic);
  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::ExecutionOrder(cyclic); }));

  auto dangling = graph;
  dangling.connections.push_back({.id = "edge-b-x", .source = "b", .source_handle = "output", .target = "x", .target_handle = std::nullopt});
  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::ValidateGraph(dangling); }));

  auto wrong_handle = graph;
  wrong_handle.connections[0].source_handle = "nope";
  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::ValidateGraph(wrong_handle); }));

  auto two_starts = graph;
  two_starts.nodes.push_back(pulse::graph::MakeNode("start-2", pulse::model::StartParams{}, {}));
  assert(Throws<pulse::util::InvalidGraph>([&] { pulse::graph::ValidateGraph(two_starts); }));
}

void TestAttachHandleRejectsDuplicates() {
  auto node = pulse::graph::MakeNode("a", Wait(1), {});
  assert(node.handles.size() == 2);
  assert(node.FindHandle(HandleKind::kTarget, std::nullopt) != nullptr);
  assert(!node.FindHandle(HandleKind::kTarget, std::nullopt)->show_button);

  assert(Throws<pulse::util::InvalidGraph>(
      [&] { pulse::graph::AttachHandle(node, pulse::model::HandlePosition::kTop, HandleKind::kSource, std::string("output")); }));

  const auto extra = pulse::graph::AttachHandle(node, pulse::model::HandlePosition::kBottom, HandleKind::kSource, std::string("alt"));
  assert(extra.show_button);
  assert(node.handles.size() == 3);
}

} // namespace

int main() {
  TestDefaultGraphHasTerminalStart();
  TestAppendLinksFromTerminalAndMovesLastFlag();
  TestAppendKeepsInputUntouched();
  TestAppendRejectsBadInputs();
  TestRemoveDropsDownstream();
  TestResetKeepsOnlyStart();
  TestUpdateParamsKeepsKind();
  TestExecutionOrderFollowsConnections();
  TestValidateRejectsCyclesAndDanglingEdges();
  TestAttachHandleRejectsDuplicates();

  std::cout << "pulse_automation_unit_graph_model: pass\n";
  return 0;
}
