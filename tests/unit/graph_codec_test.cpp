#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

#include "internal/graph/graph_codec.hpp"
#include "internal/graph/graph_ops.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = pulse::automation::v1;

using pulse::model::SlippageTolerance;

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

pulse::model::Graph SampleGraph() {
  pulse::model::SwapParams swap{.path      = {"0xwpls", "0xtoken"},
                                .amount_in = pulse::model::StaticAmount{"2.5"},
                                .slippage  = SlippageTolerance::FromDecimal(0.03)};
  pulse::model::TransferParams transfer{.token = "0xtoken", .to = "0xdest", .amount = pulse::model::PreviousOutputAmount{"amountOut", 50.0}};

  auto graph = pulse::graph::DefaultGraph();
  graph      = pulse::graph::AppendNode(graph, swap, "swap-1");
  graph      = pulse::graph::AppendNode(graph, transfer, "transfer-1");
  return graph;
}

void TestJsonRoundTripPreservesStructure() {
  const auto graph   = SampleGraph();
  const auto decoded = pulse::graph::FromJson(pulse::graph::ToJson(graph));

  assert(decoded.nodes.size() == 3);
  assert(decoded.connections.size() == 2);
  assert(decoded.FindNode("transfer-1")->is_last_node);
  assert(!decoded.connections[0].target_handle.has_value());
  assert(decoded.connections[0].source_handle == std::string("start-output"));

  const auto& swap = std::get<pulse::model::SwapParams>(decoded.FindNode("swap-1")->params);
  assert(swap.path.size() == 2);
  assert(swap.slippage.IsSelected(SlippageTolerance::Preset::kThreePercent));
  assert(std::get<pulse::model::StaticAmount>(swap.amount_in).value == "2.5");

  const auto& transfer = std::get<pulse::model::TransferParams>(decoded.FindNode("transfer-1")->params);
  const auto& share    = std::get<pulse::model::PreviousOutputAmount>(transfer.amount);
  assert(share.field == "amountOut");
  assert(share.percentage == 50.0);

  const auto* target = decoded.FindNode("swap-1")->FindHandle(pulse::model::HandleKind::kTarget, std::nullopt);
  assert(target != nullptr);
  assert(target->position == pulse::model::HandlePosition::kLeft);
}

void TestZeroSlippageTakesFallback() {
  v1::NodeParams params;
  params.mutable_swap()->add_path("0xa");

  const auto fallback = SlippageTolerance::FromDecimal(0.10);
  const auto decoded  = pulse::graph::FromProto(params, fallback);
  assert(std::get<pulse::model::SwapParams>(decoded).slippage == fallback);

  params.mutable_swap()->set_slippage(1.5);
  assert(Throws<pulse::util::InvalidArgument>([&] { pulse::graph::FromProto(params, fallback); }));
}

void TestMissingKindRejected() {
  v1::NodeParams params;
  assert(Throws<pulse::util::InvalidArgument>([&] { pulse::graph::FromProto(params); }));
}

void TestInvalidPreviousOutputRejected() {
  v1::NodeParams params;
  auto*          prev = params.mutable_transfer_pls()->mutable_amount()->mutable_previous_output();
  prev->set_field("balance");
  prev->set_percentage(120.0);
  assert(Throws<pulse::util::InvalidArgument>([&] { pulse::graph::FromProto(params); }));

  prev->set_percentage(25.0);
  prev->clear_field();
  assert(Throws<pulse::util::InvalidArgument>([&] { pulse::graph::FromProto(params); }));
}

void TestUnsetAmountIsEmptyStatic() {
  v1::NodeParams params;
  params.mutable_transfer_pls()->set_to("0xdest");

  const auto decoded = pulse::graph::FromProto(params);
  const auto& amount = std::get<pulse::model::TransferPlsParams>(decoded).amount;
  assert(std::get<pulse::model::StaticAmount>(amount).value.empty());
}

void TestMalformedJsonAndHandlesRejected() {
  assert(Throws<pulse::util::InvalidArgument>([] { pulse::graph::FromJson("{\"nodes\": 3"); }));

  auto proto = pulse::graph::ToProto(pulse::graph::DefaultGraph());
  proto.mutable_nodes(0)->mutable_handles(0)->set_position(v1::HANDLE_POSITION_UNSPECIFIED);
  assert(Throws<pulse::util::InvalidArgument>([&] { pulse::graph::FromProto(proto); }));
}

} // namespace

int main() {
  TestJsonRoundTripPreservesStructure();
  TestZeroSlippageTakesFallback();
  TestMissingKindRejected();
  TestInvalidPreviousOutputRejected();
  TestUnsetAmountIsEmptyStatic();
  TestMalformedJsonAndHandlesRejected();

  std::cout << "pulse_automation_unit_graph_codec: pass\n";
  return 0;
}
