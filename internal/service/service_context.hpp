#pragma once

#include <cstdint>
#include <memory>

#include "internal/graph/graph_ops.hpp"
#include "internal/model/slippage.hpp"

namespace pulse::db { class Repository; }
namespace pulse::status { class StatusRegistry; }
namespace pulse::execution { class ChainExecutor; }

namespace pulse::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<pulse::db::Repository> repository;
  std::shared_ptr<pulse::status::StatusRegistry> statuses;
  std::shared_ptr<pulse::execution::ChainExecutor> executor;

  pulse::model::SlippageTolerance default_slippage = pulse::model::SlippageTolerance::Default();
  double node_spacing_x = pulse::graph::kDefaultNodeSpacingX;

  // RUNNING executions older than this are failed as timed out.
  uint64_t stale_after_ms = 10 * 60 * 1000;
};

}
