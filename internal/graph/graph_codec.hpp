#pragma once

#include <string>

#include "internal/model/graph.hpp"
#include "pulse/automation/v1/graph.pb.h"

namespace pulse::graph {

/*
  Conversions between the in-memory graph model and its wire/storage form.

  The stored automation definition is the Graph message rendered as
  protobuf JSON. A swap-like node whose slippage is zero on the wire takes
  `fallback_slippage` instead.
*/

pulse::automation::v1::NodeParams ToProto(const model::NodeParams& params);
model::NodeParams                 FromProto(const pulse::automation::v1::NodeParams& params,
                                            const model::SlippageTolerance& fallback_slippage = model::SlippageTolerance::Default());

pulse::automation::v1::Graph ToProto(const model::Graph& graph);
model::Graph                 FromProto(const pulse::automation::v1::Graph& graph,
                                       const model::SlippageTolerance& fallback_slippage = model::SlippageTolerance::Default());

std::string  ToJson(const model::Graph& graph);
model::Graph FromJson(const std::string& json, const model::SlippageTolerance& fallback_slippage = model::SlippageTolerance::Default());

} // namespace pulse::graph
