#pragma once

#include "internal/execution/progress_sink.hpp"
#include "internal/execution/run_coordinator.hpp"
#include "pulse/automation/v1.hpp"
#include "service_context.hpp"

namespace pulse::service {

/*
  AutomationService

  Automation definitions, graph editing, runs and run history.

  Every graph mutation reads the stored definition, applies one pure graph
  operation and writes the result back inside a single repository
  transaction; a rejected operation leaves the stored graph untouched.
*/
class AutomationService {
 public:
  explicit AutomationService(ServiceContext ctx);

  pulse::automation::v1::Automation CreateAutomation(const pulse::automation::v1::CreateAutomationRequest& req);
  pulse::automation::v1::Automation GetAutomation(const pulse::automation::v1::GetAutomationRequest& req);
  void                              DeleteAutomation(const pulse::automation::v1::DeleteAutomationRequest& req);

  pulse::automation::v1::AppendNodeResponse AppendNode(const pulse::automation::v1::AppendNodeRequest& req);
  pulse::automation::v1::Automation         UpdateNodeParams(const pulse::automation::v1::UpdateNodeParamsRequest& req);
  pulse::automation::v1::RemoveNodeResponse RemoveNode(const pulse::automation::v1::RemoveNodeRequest& req);
  pulse::automation::v1::Automation         ResetAutomation(const pulse::automation::v1::ResetAutomationRequest& req);

  // Blocks until the run is over. Progress goes to `sink` as it happens.
  execution::RunSummary RunAutomation(const pulse::automation::v1::RunAutomationRequest& req, execution::ProgressSink& sink);

  // Marks the newest RUNNING execution CANCELLED. A run in progress notices
  // before its next node and ends without executing it.
  pulse::automation::v1::StopExecutionResponse StopExecution(const pulse::automation::v1::StopExecutionRequest& req);

  // Fails RUNNING executions that outlived the stale threshold (timed out
  // runs, runs orphaned by a restart).
  pulse::automation::v1::ClearStaleExecutionsResponse ClearStaleExecutions(const pulse::automation::v1::ClearStaleExecutionsRequest& req);

  pulse::automation::v1::Execution              GetExecution(const pulse::automation::v1::GetExecutionRequest& req);
  pulse::automation::v1::ListExecutionsResponse ListExecutions(const pulse::automation::v1::ListExecutionsRequest& req);

  pulse::automation::v1::GetNodeStatusesResponse GetNodeStatuses(const pulse::automation::v1::GetNodeStatusesRequest& req);

 private:
  ServiceContext            ctx_;
  execution::RunCoordinator coordinator_;
};

} // namespace pulse::service
