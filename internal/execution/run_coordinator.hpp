#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/execution_record.hpp"
#include "internal/execution/chain_executor.hpp"
#include "internal/execution/progress_sink.hpp"
#include "internal/model/graph.hpp"
#include "internal/status/status_board.hpp"

namespace pulse::db {
class Repository;
}
namespace pulse::status {
class StatusRegistry;
}

namespace pulse::execution {

struct RunSummary {
  std::string                execution_id;
  status::RunId              run;
  bool                       success = false;
  pulse::automation::v1::RunStatus status = pulse::automation::v1::RUN_STATUS_RUNNING;
  std::string                error;
  std::vector<std::string>   completed_node_ids;
  std::optional<std::string> failed_node_id;
};

/*
  RunCoordinator

  Drives one run of an automation graph:

    - records the execution (RUNNING) and begins a run on the status board
      in one transaction, so sequences reach the board in order
    - executes non-start nodes in topological order, one at a time
    - per node: loading -> success|error, serialized result streamed,
      logged and kept as the node's latest result
    - stops at the first failing node, or before the next node once the
      stored execution has left RUNNING (stopped by a user, timed out)
    - always finishes the run, records its outcome and emits DONE

  Structural problems (invalid graph, cycle) and a board that already
  holds a newer run throw before anything is recorded. Once the run has
  begun, no failure leaves a node loading or the execution RUNNING. A sink
  that stops accepting events does not stop the run.
*/
class RunCoordinator {
 public:
  RunCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<status::StatusRegistry> statuses);

  RunSummary Run(const std::string& automation_id, const model::Graph& graph, ChainExecutor& executor, ProgressSink& sink);

 private:
  db::model::ExecutionRecord BeginExecution(const std::string& automation_id, const std::vector<std::string>& order,
                                            status::StatusBoard& board);

  // The stored record when something other than this run ended it.
  std::optional<db::model::ExecutionRecord> EndedElsewhere(const std::string& execution_id);

  // Writes the outcome unless the stored record already left RUNNING, in
  // which case the stored outcome is adopted into the summary.
  void RecordOutcome(db::model::ExecutionRecord& record, RunSummary& summary);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<status::StatusRegistry> statuses_;
};

} // namespace pulse::execution
