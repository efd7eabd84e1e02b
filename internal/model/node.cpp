#include "internal/model/node.hpp"

#include <array>
#include <utility>

#include "internal/util/overloaded.hpp"

namespace pulse::model {

namespace {

using util::Overloaded;

constexpr std::array<std::pair<NodeKind, std::string_view>, 9> kKindNames = {{
    {NodeKind::kStart, "start"},
    {NodeKind::kTransfer, "transfer"},
    {NodeKind::kTransferPls, "transferPLS"},
    {NodeKind::kSwap, "swap"},
    {NodeKind::kAddLiquidity, "addLiquidity"},
    {NodeKind::kRemoveLiquidity, "removeLiquidity"},
    {NodeKind::kCheckBalance, "checkBalance"},
    {NodeKind::kWait, "wait"},
    {NodeKind::kGasGuard, "gasGuard"},
}};

}  // namespace

NodeKind KindOf(const NodeParams& params) {
  return std::visit(Overloaded{
                        [](const StartParams&) { return NodeKind::kStart; },
                        [](const TransferParams&) { return NodeKind::kTransfer; },
                        [](const TransferPlsParams&) { return NodeKind::kTransferPls; },
                        [](const SwapParams&) { return NodeKind::kSwap; },
                        [](const AddLiquidityParams&) { return NodeKind::kAddLiquidity; },
                        [](const RemoveLiquidityParams&) { return NodeKind::kRemoveLiquidity; },
                        [](const CheckBalanceParams&) { return NodeKind::kCheckBalance; },
                        [](const WaitParams&) { return NodeKind::kWait; },
                        [](const GasGuardParams&) { return NodeKind::kGasGuard; },
                    },
                    params);
}

std::string_view KindName(NodeKind kind) {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<NodeKind> KindFromName(std::string_view name) {
  for (const auto& [k, n] : kKindNames) {
    if (n == name) {
      return k;
    }
  }
  return std::nullopt;
}

std::optional<SlippageTolerance> SlippageOf(const NodeParams& params) {
  return std::visit(Overloaded{
                        [](const SwapParams& p) -> std::optional<SlippageTolerance> { return p.slippage; },
                        [](const AddLiquidityParams& p) -> std::optional<SlippageTolerance> { return p.slippage; },
                        [](const RemoveLiquidityParams& p) -> std::optional<SlippageTolerance> { return p.slippage; },
                        [](const auto&) -> std::optional<SlippageTolerance> { return std::nullopt; },
                    },
                    params);
}

bool IsSwapLike(NodeKind kind) {
  return kind == NodeKind::kSwap || kind == NodeKind::kAddLiquidity || kind == NodeKind::kRemoveLiquidity;
}

const Handle* Node::FindHandle(HandleKind handle_kind, const std::optional<std::string>& handle_id) const {
  for (const auto& handle : handles) {
    if (handle.kind == handle_kind && handle.id == handle_id) {
      return &handle;
    }
  }
  return nullptr;
}

const Handle* Node::FirstHandle(HandleKind handle_kind) const {
  for (const auto& handle : handles) {
    if (handle.kind == handle_kind) {
      return &handle;
    }
  }
  return nullptr;
}

}  // namespace pulse::model
