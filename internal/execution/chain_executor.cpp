#include "internal/execution/chain_executor.hpp"

#include "internal/util/errors.hpp"

namespace pulse::execution {

serialization::ChainValue UnavailableChainExecutor::Execute(const model::Node& node, const ExecutionContext&) {
  throw util::InvalidState("chain executor is not configured; cannot run node '" + node.id + "'");
}

} // namespace pulse::execution
