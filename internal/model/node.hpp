#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/handle.hpp"
#include "internal/model/slippage.hpp"

namespace pulse::model {

// ---------------------------------------------------------------------
// Amounts
// ---------------------------------------------------------------------

// Human-readable value in token units, e.g. "1.5".
struct StaticAmount {
  std::string value;
};

// Share of a field produced by the previous node in the run.
struct PreviousOutputAmount {
  std::string field;
  double      percentage = 100.0;
};

using AmountSpec = std::variant<StaticAmount, PreviousOutputAmount>;

// ---------------------------------------------------------------------
// Per-kind parameters
// ---------------------------------------------------------------------

struct StartParams {};

struct TransferParams {
  std::string token;
  std::string to;
  AmountSpec  amount;
};

struct TransferPlsParams {
  std::string to;
  AmountSpec  amount;
};

struct SwapParams {
  std::vector<std::string> path;
  AmountSpec               amount_in;
  SlippageTolerance        slippage = SlippageTolerance::Default();
};

struct AddLiquidityParams {
  std::string       token_a;
  std::string       token_b;
  AmountSpec        amount_a;
  AmountSpec        amount_b;
  SlippageTolerance slippage = SlippageTolerance::Default();
};

struct RemoveLiquidityParams {
  std::string       token_a;
  std::string       token_b;
  AmountSpec        liquidity;
  SlippageTolerance slippage = SlippageTolerance::Default();
};

struct CheckBalanceParams {
  std::string token;  // empty = native PLS
};

struct WaitParams {
  std::uint32_t seconds = 0;
};

struct GasGuardParams {
  double max_gas_price_gwei = 0.0;
};

using NodeParams = std::variant<StartParams, TransferParams, TransferPlsParams, SwapParams, AddLiquidityParams, RemoveLiquidityParams,
                                CheckBalanceParams, WaitParams, GasGuardParams>;

enum class NodeKind : std::uint8_t {
  kStart,
  kTransfer,
  kTransferPls,
  kSwap,
  kAddLiquidity,
  kRemoveLiquidity,
  kCheckBalance,
  kWait,
  kGasGuard,
};

NodeKind                KindOf(const NodeParams& params);
std::string_view        KindName(NodeKind kind);
std::optional<NodeKind> KindFromName(std::string_view name);

// Swap-like kinds carry a slippage tolerance.
std::optional<SlippageTolerance> SlippageOf(const NodeParams& params);
bool                             IsSwapLike(NodeKind kind);

// ---------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------

struct Point {
  double x = 0.0;
  double y = 0.0;
};

struct Node {
  std::string         id;
  NodeParams          params;
  Point               position;  // layout only, opaque to execution
  std::vector<Handle> handles;
  bool                is_last_node = false;

  NodeKind kind() const {
    return KindOf(params);
  }

  const Handle* FindHandle(HandleKind kind, const std::optional<std::string>& handle_id) const;
  const Handle* FirstHandle(HandleKind kind) const;
};

}  // namespace pulse::model
