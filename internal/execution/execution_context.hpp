#pragma once

#include <gmpxx.h>

#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/node.hpp"
#include "internal/serialization/chain_value.hpp"
#include "internal/status/status_board.hpp"

namespace pulse::execution {

inline constexpr unsigned kNativeDecimals = 18;

// "1.5" -> 1500000000000000000 for 18 decimals. Empty when the text is not a
// non-negative decimal with at most `decimals` fractional digits.
std::optional<mpz_class> ParseUnits(const std::string& text, unsigned decimals = kNativeDecimals);

/*
  ExecutionContext

  State carried from node to node within one run: the run identity, the
  node executed last, and every node's raw output so far.
*/
class ExecutionContext {
 public:
  ExecutionContext(std::string automation_id, status::RunId run);

  const std::string& automation_id() const {
    return automation_id_;
  }
  const status::RunId& run() const {
    return run_;
  }

  void Record(const model::Node& node, serialization::ChainValue output);

  const std::optional<std::string>& previous_node_id() const {
    return previous_node_id_;
  }
  const std::optional<model::NodeKind>& previous_node_kind() const {
    return previous_node_kind_;
  }

  const serialization::ChainValue* OutputOf(const std::string& node_id) const;

  // Static amounts are token units with 18 decimals; empty means zero.
  // Previous-output amounts take a percentage of a field of the last node's
  // output, floored to 0.01%.
  mpz_class ResolveAmount(const model::AmountSpec& amount) const;

 private:
  std::string                                                automation_id_;
  status::RunId                                              run_;
  std::optional<std::string>                                 previous_node_id_;
  std::optional<model::NodeKind>                             previous_node_kind_;
  std::unordered_map<std::string, serialization::ChainValue> outputs_;
};

} // namespace pulse::execution
