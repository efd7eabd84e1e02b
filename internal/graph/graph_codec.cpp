#include "internal/graph/graph_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace pulse::graph {

namespace v1 = pulse::automation::v1;

using util::Overloaded;

namespace {

// ---------------------------------------------------------------------
// Amounts and slippage
// ---------------------------------------------------------------------

v1::Amount AmountToProto(const model::AmountSpec& amount) {
  v1::Amount out;
  std::visit(Overloaded{
                 [&](const model::StaticAmount& a) { out.mutable_static_value()->set_value(a.value); },
                 [&](const model::PreviousOutputAmount& a) {
                   auto* prev = out.mutable_previous_output();
                   prev->set_field(a.field);
                   prev->set_percentage(a.percentage);
                 },
             },
             amount);
  return out;
}

model::AmountSpec AmountFromProto(const v1::Amount& amount) {
  switch (amount.kind_case()) {
    case v1::Amount::kStaticValue:
      return model::StaticAmount{.value = amount.static_value().value()};
    case v1::Amount::kPreviousOutput: {
      const auto& prev = amount.previous_output();
      if (prev.field().empty()) {
        throw util::InvalidArgument("previous output amount requires a field name");
      }
      if (prev.percentage() <= 0.0 || prev.percentage() > 100.0) {
        throw util::InvalidArgument("previous output percentage must be in (0, 100]");
      }
      return model::PreviousOutputAmount{.field = prev.field(), .percentage = prev.percentage()};
    }
    case v1::Amount::KIND_NOT_SET:
      break;
  }
  // An absent amount is an empty static value; the executor rejects it at run time.
  return model::StaticAmount{};
}

model::SlippageTolerance SlippageFromProto(double decimal, const model::SlippageTolerance& fallback) {
  if (decimal == 0.0) {
    return fallback;
  }
  return model::SlippageTolerance::FromDecimal(decimal);
}

// ---------------------------------------------------------------------
// Handles
// ---------------------------------------------------------------------

v1::HandleKind KindToProto(model::HandleKind kind) {
  return kind == model::HandleKind::kSource ? v1::HANDLE_KIND_SOURCE : v1::HANDLE_KIND_TARGET;
}

model::HandleKind KindFromProto(v1::HandleKind kind) {
  switch (kind) {
    case v1::HANDLE_KIND_SOURCE:
      return model::HandleKind::kSource;
    case v1::HANDLE_KIND_TARGET:
      return model::HandleKind::kTarget;
    default:
      throw util::InvalidArgument("handle kind must be SOURCE or TARGET");
  }
}

v1::HandlePosition PositionToProto(model::HandlePosition position) {
  switch (position) {
    case model::HandlePosition::kTop:
      return v1::HANDLE_POSITION_TOP;
    case model::HandlePosition::kBottom:
      return v1::HANDLE_POSITION_BOTTOM;
    case model::HandlePosition::kLeft:
      return v1::HANDLE_POSITION_LEFT;
    case model::HandlePosition::kRight:
      return v1::HANDLE_POSITION_RIGHT;
  }
  return v1::HANDLE_POSITION_UNSPECIFIED;
}

model::HandlePosition PositionFromProto(v1::HandlePosition position) {
  switch (position) {
    case v1::HANDLE_POSITION_TOP:
      return model::HandlePosition::kTop;
    case v1::HANDLE_POSITION_BOTTOM:
      return model::HandlePosition::kBottom;
    case v1::HANDLE_POSITION_LEFT:
      return model::HandlePosition::kLeft;
    case v1::HANDLE_POSITION_RIGHT:
      return model::HandlePosition::kRight;
    default:
      throw util::InvalidArgument("handle position must be TOP, BOTTOM, LEFT or RIGHT");
  }
}

} // namespace

// ---------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------

v1::NodeParams ToProto(const model::NodeParams& params) {
  v1::NodeParams out;
  std::visit(Overloaded{
                 [&](const model::StartParams&) { out.mutable_start(); },
                 [&](const model::TransferParams& p) {
                   auto* t = out.mutable_transfer();
                   t->set_token(p.token);
                   t->set_to(p.to);
                   *t->mutable_amount() = AmountToProto(p.amount);
                 },
                 [&](const model::TransferPlsParams& p) {
                   auto* t = out.mutable_transfer_pls();
                   t->set_to(p.to);
                   *t->mutable_amount() = AmountToProto(p.amount);
                 },
                 [&](const model::SwapParams& p) {
                   auto* s = out.mutable_swap();
                   for (const auto& token : p.path) {
                     s->add_path(token);
                   }
                   *s->mutable_amount_in() = AmountToProto(p.amount_in);
                   s->set_slippage(p.slippage.decimal());
                 },
                 [&](const model::AddLiquidityParams& p) {
                   auto* a = out.mutable_add_liquidity();
                   a->set_token_a(p.token_a);
                   a->set_token_b(p.token_b);
                   *a->mutable_amount_a() = AmountToProto(p.amount_a);
                   *a->mutable_amount_b() = AmountToProto(p.amount_b);
                   a->set_slippage(p.slippage.decimal());
                 },
                 [&](const model::RemoveLiquidityParams& p) {
                   auto* r = out.mutable_remove_liquidity();
                   r->set_token_a(p.token_a);
                   r->set_token_b(p.token_b);
                   *r->mutable_liquidity() = AmountToProto(p.liquidity);
                   r->set_slippage(p.slippage.decimal());
                 },
                 [&](const model::CheckBalanceParams& p) { out.mutable_check_balance()->set_token(p.token); },
                 [&](const model::WaitParams& p) { out.mutable_wait()->set_seconds(p.seconds); },
                 [&](const model::GasGuardParams& p) { out.mutable_gas_guard()->set_max_gas_price_gwei(p.max_gas_price_gwei); },
             },
             params);
  return out;
}

model::NodeParams FromProto(const v1::NodeParams& params, const model::SlippageTolerance& fallback_slippage) {
  switch (params.kind_case()) {
    case v1::NodeParams::kStart:
      return model::StartParams{};
    case v1::NodeParams::kTransfer: {
      const auto& t = params.transfer();
      return model::TransferParams{.token = t.token(), .to = t.to(), .amount = AmountFromProto(t.amount())};
    }
    case v1::NodeParams::kTransferPls: {
      const auto& t = params.transfer_pls();
      return model::TransferPlsParams{.to = t.to(), .amount = AmountFromProto(t.amount())};
    }
    case v1::NodeParams::kSwap: {
      const auto& s = params.swap();
      return model::SwapParams{.path      = {s.path().begin(), s.path().end()},
                               .amount_in = AmountFromProto(s.amount_in()),
                               .slippage  = SlippageFromProto(s.slippage(), fallback_slippage)};
    }
    case v1::NodeParams::kAddLiquidity: {
      const auto& a = params.add_liquidity();
      return model::AddLiquidityParams{.token_a  = a.token_a(),
                                       .token_b  = a.token_b(),
                                       .amount_a = AmountFromProto(a.amount_a()),
                                       .amount_b = AmountFromProto(a.amount_b()),
                                       .slippage = SlippageFromProto(a.slippage(), fallback_slippage)};
    }
    case v1::NodeParams::kRemoveLiquidity: {
      const auto& r = params.remove_liquidity();
      return model::RemoveLiquidityParams{.token_a   = r.token_a(),
                                          .token_b   = r.token_b(),
                                          .liquidity = AmountFromProto(r.liquidity()),
                                          .slippage  = SlippageFromProto(r.slippage(), fallback_slippage)};
    }
    case v1::NodeParams::kCheckBalance:
      return model::CheckBalanceParams{.token = params.check_balance().token()};
    case v1::NodeParams::kWait:
      return model::WaitParams{.seconds = params.wait().seconds()};
    case v1::NodeParams::kGasGuard:
      return model::GasGuardParams{.max_gas_price_gwei = params.gas_guard().max_gas_price_gwei()};
    case v1::NodeParams::KIND_NOT_SET:
      break;
  }
  throw util::InvalidArgument("node params: node kind is not set");
}

// ---------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------

v1::Graph ToProto(const model::Graph& graph) {
  v1::Graph out;
  for (const auto& node : graph.nodes) {
    auto* n = out.add_nodes();
    n->set_id(node.id);
    *n->mutable_params() = ToProto(node.params);
    n->mutable_position()->set_x(node.position.x);
    n->mutable_position()->set_y(node.position.y);
    n->set_is_last_node(node.is_last_node);
    for (const auto& handle : node.handles) {
      auto* h = n->add_handles();
      if (handle.id) {
        h->set_id(*handle.id);
      }
      h->set_kind(KindToProto(handle.kind));
      h->set_position(PositionToProto(handle.position));
      h->set_show_button(handle.show_button);
    }
  }
  for (const auto& connection : graph.connections) {
    auto* c = out.add_connections();
    c->set_id(connection.id);
    c->set_source(connection.source);
    if (connection.source_handle) {
      c->set_source_handle(*connection.source_handle);
    }
    c->set_target(connection.target);
    if (connection.target_handle) {
      c->set_target_handle(*connection.target_handle);
    }
  }
  return out;
}

model::Graph FromProto(const v1::Graph& graph, const model::SlippageTolerance& fallback_slippage) {
  model::Graph out;
  out.nodes.reserve(graph.nodes_size());
  for (const auto& n : graph.nodes()) {
    model::Node node;
    node.id           = n.id();
    node.params       = FromProto(n.params(), fallback_slippage);
    node.position     = {n.position().x(), n.position().y()};
    node.is_last_node = n.is_last_node();
    for (const auto& h : n.handles()) {
      model::Handle handle;
      if (h.has_id()) {
        handle.id = h.id();
      }
      handle.kind        = KindFromProto(h.kind());
      handle.position    = PositionFromProto(h.position());
      handle.show_button = h.show_button();
      node.handles.push_back(std::move(handle));
    }
    out.nodes.push_back(std::move(node));
  }

  out.connections.reserve(graph.connections_size());
  for (const auto& c : graph.connections()) {
    model::Connection connection;
    connection.id     = c.id();
    connection.source = c.source();
    if (c.has_source_handle()) {
      connection.source_handle = c.source_handle();
    }
    connection.target = c.target();
    if (c.has_target_handle()) {
      connection.target_handle = c.target_handle();
    }
    out.connections.push_back(std::move(connection));
  }
  return out;
}

std::string ToJson(const model::Graph& graph) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(graph), &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode graph: " + std::string(status.message()));
  }
  return json;
}

model::Graph FromJson(const std::string& json, const model::SlippageTolerance& fallback_slippage) {
  v1::Graph proto;
  auto      status = google::protobuf::util::JsonStringToMessage(json, &proto);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to decode graph: " + std::string(status.message()));
  }
  return FromProto(proto, fallback_slippage);
}

} // namespace pulse::graph
