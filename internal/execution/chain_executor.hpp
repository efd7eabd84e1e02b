#pragma once

#include "internal/model/node.hpp"
#include "internal/serialization/chain_value.hpp"

namespace pulse::execution {

class ExecutionContext;

/*
  Performs one node's on-chain step.

  Implementations talk to the chain (RPC, signer, contract calls). Execute
  returns the raw provider result and throws on failure; the run
  coordinator owns status, serialization and persistence around it.
*/
class ChainExecutor {
 public:
  virtual ~ChainExecutor() = default;

  virtual serialization::ChainValue Execute(const model::Node& node, const ExecutionContext& context) = 0;
};

// Installed when no chain client is configured; every node fails.
class UnavailableChainExecutor final : public ChainExecutor {
 public:
  serialization::ChainValue Execute(const model::Node& node, const ExecutionContext& context) override;
};

} // namespace pulse::execution
