#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/execution/chain_executor.hpp"
#include "internal/execution/execution_context.hpp"
#include "internal/grpc/automation_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/automation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/status/status_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "pulse/automation/v1.hpp"

namespace {

namespace v1 = pulse::automation::v1;

using pulse::serialization::ChainObject;
using pulse::serialization::ChainValue;

// Succeeds for every node except wait nodes, which fail.
class WaitFailsExecutor final : public pulse::execution::ChainExecutor {
 public:
  ChainValue Execute(const pulse::model::Node& node, const pulse::execution::ExecutionContext&) override {
    if (node.kind() == pulse::model::NodeKind::kWait) {
      throw std::runtime_error("wait interrupted");
    }
    return ChainValue::Object(ChainObject{{"hash", ChainValue::String("0x" + node.id)}, {"blockNumber", ChainValue::Number(7)}});
  }
};

// Succeeds, but asks the service to stop the run while the first swap is in
// flight.
class StopOnSwapExecutor final : public pulse::execution::ChainExecutor {
 public:
  ChainValue Execute(const pulse::model::Node& node, const pulse::execution::ExecutionContext& context) override {
    if (node.kind() == pulse::model::NodeKind::kSwap && service != nullptr) {
      v1::StopExecutionRequest stop;
      stop.set_automation_id(context.automation_id());
      stopped_execution_id = service->StopExecution(stop).execution_id();
    }
    return ChainValue::Object(ChainObject{{"hash", ChainValue::String("0x" + node.id)}, {"blockNumber", ChainValue::Number(9)}});
  }

  pulse::service::AutomationService* service = nullptr;
  std::string                        stopped_execution_id;
};

class CollectingSink final : public pulse::execution::ProgressSink {
 public:
  bool Publish(const v1::ProgressEvent& event) override {
    events.push_back(event);
    return true;
  }

  std::vector<v1::ProgressEvent> events;
};

pulse::service::ServiceContext BuildServiceContext() {
  pulse::service::ServiceContext ctx;
  ctx.repository = std::make_shared<pulse::db::memory::MemoryRepository>();
  ctx.statuses   = std::make_shared<pulse::status::StatusRegistry>();
  ctx.executor   = std::make_shared<WaitFailsExecutor>();
  return ctx;
}

v1::Automation Create(pulse::service::AutomationService& service, double slippage = 0.0) {
  v1::CreateAutomationRequest req;
  req.set_owner_id("owner-1");
  req.set_name("daily swap");
  req.set_default_slippage(slippage);
  return service.CreateAutomation(req);
}

v1::AppendNodeResponse Append(pulse::service::AutomationService& service, const std::string& automation_id, const v1::NodeParams& params) {
  v1::AppendNodeRequest req;
  req.set_automation_id(automation_id);
  *req.mutable_params() = params;
  return service.AppendNode(req);
}

v1::NodeParams SwapParams() {
  v1::NodeParams params;
  params.mutable_swap()->add_path("0xwpls");
  params.mutable_swap()->add_path("0xtoken");
  params.mutable_swap()->mutable_amount_in()->mutable_static_value()->set_value("1");
  return params;
}

v1::NodeParams WaitParams(uint32_t seconds) {
  v1::NodeParams params;
  params.mutable_wait()->set_seconds(seconds);
  return params;
}

void TestCreateStartsWithDefaultGraph() {
  pulse::service::AutomationService service(BuildServiceContext());

  const auto automation = Create(service);
  assert(!automation.id().empty());
  assert(automation.owner_id() == "owner-1");
  assert(automation.default_slippage() == 0.01);
  assert(automation.graph().nodes_size() == 1);
  assert(automation.graph().nodes(0).params().has_start());
  assert(automation.graph().nodes(0).is_last_node());

  v1::GetAutomationRequest get;
  get.set_id(automation.id());
  assert(service.GetAutomation(get).name() == "daily swap");
}

void TestAppendUsesAutomationSlippage() {
  pulse::service::AutomationService service(BuildServiceContext());
  const auto                        automation = Create(service, 0.03);

  const auto appended = Append(service, automation.id(), SwapParams());
  assert(appended.node_id().rfind("swap-", 0) == 0);

  const auto& graph = appended.automation().graph();
  assert(graph.nodes_size() == 2);
  assert(graph.connections_size() == 1);
  assert(graph.nodes(1).id() == appended.node_id());
  assert(graph.nodes(1).is_last_node());
  assert(!graph.nodes(0).is_last_node());
  assert(graph.nodes(1).params().swap().slippage() == 0.03);

  // stored, not just returned
  v1::GetAutomationRequest get;
  get.set_id(automation.id());
  assert(service.GetAutomation(get).graph().nodes_size() == 2);
}

void TestRemoveReportsDownstreamNodes() {
  pulse::service::AutomationService service(BuildServiceContext());
  const auto                        automation = Create(service);

  const auto first  = Append(service, automation.id(), WaitParams(1)).node_id();
  const auto second = Append(service, automation.id(), WaitParams(2)).node_id();
  const auto third  = Append(service, automation.id(), WaitParams(3)).node_id();

  v1::RemoveNodeRequest req;
  req.set_automation_id(automation.id());
  req.set_node_id(second);
  const auto resp = service.RemoveNode(req);

  assert(resp.removed_node_ids_size() == 2);
  assert(resp.removed_node_ids(0) == second);
  assert(resp.removed_node_ids(1) == third);
  assert(resp.automation().graph().nodes_size() == 2);
  assert(resp.automation().graph().nodes(1).id() == first);
  assert(resp.automation().graph().nodes(1).is_last_node());

  v1::ResetAutomationRequest reset;
  reset.set_automation_id(automation.id());
  assert(service.ResetAutomation(reset).graph().nodes_size() == 1);
}

void TestUpdateKeepsKindAndEdges() {
  pulse::service::AutomationService service(BuildServiceContext());
  const auto                        automation = Create(service);
  const auto                        node_id    = Append(service, automation.id(), WaitParams(1)).node_id();

  v1::UpdateNodeParamsRequest req;
  req.set_automation_id(automation.id());
  req.set_node_id(node_id);
  *req.mutable_params() = WaitParams(30);

  const auto updated = service.UpdateNodeParams(req);
  assert(updated.graph().nodes(1).params().wait().seconds() == 30);
  assert(updated.graph().connections_size() == 1);
}

void TestRunRecordsHistoryAndStatuses() {
  pulse::service::AutomationService service(BuildServiceContext());
  const auto                        automation = Create(service);
  const auto                        swap_id    = Append(service, automation.id(), SwapParams()).node_id();
  const auto                        wait_id    = Append(service, automation.id(), WaitParams(5)).node_id();

  v1::RunAutomationRequest run;
  run.set_automation_id(automation.id());

  CollectingSink sink;
  const auto     summary = service.RunAutomation(run, sink);
  assert(!summary.success);
  assert(summary.failed_node_id == wait_id);
  assert(sink.events.back().type() == v1::PROGRESS_EVENT_TYPE_DONE);
  assert(!sink.events.back().success());

  v1::GetNodeStatusesRequest statuses_req;
  statuses_req.set_automation_id(automation.id());
  const auto statuses = service.GetNodeStatuses(statuses_req);
  assert(statuses.current_run().execution_id() == summary.execution_id);
  assert(statuses.statuses_size() == 3);
  assert(statuses.statuses(0).status() == v1::NODE_STATUS_INITIAL);
  assert(statuses.statuses(1).node_id() == swap_id);
  assert(statuses.statuses(1).status() == v1::NODE_STATUS_SUCCESS);
  assert(statuses.statuses(2).status() == v1::NODE_STATUS_ERROR);

  // the swap's stored receipt comes back with its status; the failed wait has none
  assert(!statuses.statuses(0).has_latest_result());
  assert(statuses.statuses(1).has_latest_result());
  assert(statuses.statuses(1).latest_result().struct_value().fields().at("hash").string_value() == "0x" + swap_id);
  assert(statuses.statuses(1).latest_result().struct_value().fields().at("blockNumber").string_value() == "7");
  assert(statuses.statuses(1).result_run().execution_id() == summary.execution_id);
  assert(statuses.statuses(1).result_run().sequence() == 1);
  assert(!statuses.statuses(2).has_latest_result());

  v1::GetExecutionRequest get;
  get.set_id(summary.execution_id);
  const auto execution = service.GetExecution(get);
  assert(execution.status() == v1::RUN_STATUS_FAILED);
  assert(execution.run_sequence() == 1);
  assert(execution.logs_size() == 2);
  assert(execution.logs(0).output().struct_value().fields().at("blockNumber").string_value() == "7");
  assert(execution.logs(0).input().struct_value().fields().count("swap") == 1);
  assert(execution.logs(1).error() == "wait interrupted");

  service.RunAutomation(run, sink);

  v1::ListExecutionsRequest list;
  list.set_automation_id(automation.id());
  assert(service.ListExecutions(list).executions_size() == 2);
  list.set_limit(1);
  const auto newest = service.ListExecutions(list);
  assert(newest.executions_size() == 1);
  assert(newest.executions(0).run_sequence() == 2);

  // latest results follow the newest run
  const auto after_second = service.GetNodeStatuses(statuses_req);
  assert(after_second.statuses(1).result_run().sequence() == 2);
}

void TestStopEndsTheRunBeforeTheNextNode() {
  auto executor = std::make_shared<StopOnSwapExecutor>();
  auto ctx      = BuildServiceContext();
  ctx.executor  = executor;
  pulse::service::AutomationService service(ctx);
  executor->service = &service;

  const auto automation = Create(service);
  const auto swap_id    = Append(service, automation.id(), SwapParams()).node_id();
  const auto wait_id    = Append(service, automation.id(), WaitParams(5)).node_id();

  v1::RunAutomationRequest run;
  run.set_automation_id(automation.id());
  CollectingSink sink;
  const auto     summary = service.RunAutomation(run, sink);

  assert(executor->stopped_execution_id == summary.execution_id);
  assert(summary.status == v1::RUN_STATUS_CANCELLED);
  assert((summary.completed_node_ids == std::vector<std::string>{swap_id}));
  assert(sink.events.back().type() == v1::PROGRESS_EVENT_TYPE_DONE);
  assert(sink.events.back().run_status() == v1::RUN_STATUS_CANCELLED);

  v1::GetExecutionRequest get;
  get.set_id(summary.execution_id);
  const auto execution = service.GetExecution(get);
  assert(execution.status() == v1::RUN_STATUS_CANCELLED);
  assert(execution.error() == "Cancelled by user");
  assert(execution.has_finished_at());
  assert(execution.logs_size() == 1);

  v1::GetNodeStatusesRequest statuses_req;
  statuses_req.set_automation_id(automation.id());
  const auto statuses = service.GetNodeStatuses(statuses_req);
  assert(statuses.statuses(2).node_id() == wait_id);
  assert(statuses.statuses(2).status() == v1::NODE_STATUS_INITIAL);

  // nothing is running any more
  v1::StopExecutionRequest stop;
  stop.set_automation_id(automation.id());
  bool threw = false;
  try {
    service.StopExecution(stop);
  } catch (const pulse::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

pulse::db::model::ExecutionRecord InsertRunning(pulse::db::Repository& repository, const std::string& automation_id, uint64_t sequence,
                                                uint64_t started_at_ms) {
  pulse::db::model::ExecutionRecord record;
  record.id            = automation_id + "-run-" + std::to_string(sequence);
  record.automation_id = automation_id;
  record.run_sequence  = sequence;
  record.status        = v1::RUN_STATUS_RUNNING;
  record.started_at_ms = started_at_ms;

  auto       tx       = repository.Begin();
  const auto inserted = repository.InsertExecution(*tx, record);
  assert(inserted);
  tx->Commit();
  return record;
}

void TestClearStaleFailsOnlyOldRunningExecutions() {
  auto                              ctx = BuildServiceContext();
  pulse::service::AutomationService service(ctx);

  const auto mine = Create(service);

  v1::CreateAutomationRequest other_req;
  other_req.set_owner_id("owner-2");
  other_req.set_name("other");
  const auto other = service.CreateAutomation(other_req);

  const uint64_t now        = pulse::util::NowMillis();
  const uint64_t twenty_min = 20 * 60 * 1000;
  const auto     old_mine   = InsertRunning(*ctx.repository, mine.id(), 1, now - twenty_min);
  const auto     fresh_mine = InsertRunning(*ctx.repository, mine.id(), 2, now);
  const auto     old_other  = InsertRunning(*ctx.repository, other.id(), 1, now - twenty_min);

  v1::ClearStaleExecutionsRequest req;
  req.set_owner_id("owner-1");
  const auto cleared = service.ClearStaleExecutions(req);
  assert(cleared.execution_ids_size() == 1);
  assert(cleared.execution_ids(0) == old_mine.id);

  v1::GetExecutionRequest get;
  get.set_id(old_mine.id);
  const auto timed_out = service.GetExecution(get);
  assert(timed_out.status() == v1::RUN_STATUS_FAILED);
  assert(timed_out.error() == "Execution timed out");
  assert(timed_out.has_finished_at());

  get.set_id(fresh_mine.id);
  assert(service.GetExecution(get).status() == v1::RUN_STATUS_RUNNING);
  get.set_id(old_other.id);
  assert(service.GetExecution(get).status() == v1::RUN_STATUS_RUNNING);

  // without an owner every stale run is swept; a second sweep finds nothing
  const auto everyone = service.ClearStaleExecutions(v1::ClearStaleExecutionsRequest{});
  assert(everyone.execution_ids_size() == 1);
  assert(everyone.execution_ids(0) == old_other.id);
  assert(service.ClearStaleExecutions(v1::ClearStaleExecutionsRequest{}).execution_ids_size() == 0);

  // an explicit threshold overrides the configured one
  v1::ClearStaleExecutionsRequest tight;
  tight.set_stale_after_seconds(3);
  InsertRunning(*ctx.repository, mine.id(), 3, now - 10000);
  assert(service.ClearStaleExecutions(tight).execution_ids_size() == 1);
}

void TestStatusesBeforeAnyRunAreInitial() {
  pulse::service::AutomationService service(BuildServiceContext());
  const auto                        automation = Create(service);
  Append(service, automation.id(), WaitParams(1));

  v1::GetNodeStatusesRequest req;
  req.set_automation_id(automation.id());
  const auto resp = service.GetNodeStatuses(req);
  assert(!resp.has_current_run());
  assert(resp.statuses_size() == 2);
  for (const auto& entry : resp.statuses()) {
    assert(entry.status() == v1::NODE_STATUS_INITIAL);
  }
}

void TestErrorKindsMapToStatusCodes() {
  using pulse::grpc::ToStatus;
  assert(ToStatus(pulse::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(pulse::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(pulse::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(pulse::util::InvalidGraph("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(pulse::util::InvalidArgument("bad slippage")).error_message() == "bad slippage");

  // a non-domain exception is INTERNAL even when its message looks like a domain one
  assert(ToStatus(std::runtime_error("not found")).error_code() == ::grpc::StatusCode::INTERNAL);

  const pulse::util::Error& as_base = pulse::util::InvalidGraph("cycle");
  assert(as_base.kind() == pulse::util::ErrorKind::kInvalidGraph);
  assert(pulse::util::ToString(as_base.kind()) == "invalid_graph");
}

void TestServerMapsErrorsToStatusCodes() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<pulse::service::AutomationService>(ctx);
  pulse::grpc::AutomationServer server(service);
  const auto                    automation = Create(*service);

  {
    v1::CreateAutomationRequest req;
    v1::Automation              resp;
    ::grpc::ServerContext       grpc_ctx;
    assert(server.CreateAutomation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    v1::GetAutomationRequest req;
    req.set_id("missing-automation");
    v1::Automation        resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.GetAutomation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    // the start node is never removable
    v1::RemoveNodeRequest req;
    req.set_automation_id(automation.id());
    req.set_node_id(automation.graph().nodes(0).id());
    v1::RemoveNodeResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    assert(server.RemoveNode(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
  {
    const auto node_id = Append(*service, automation.id(), WaitParams(1)).node_id();

    v1::UpdateNodeParamsRequest req;
    req.set_automation_id(automation.id());
    req.set_node_id(node_id);
    *req.mutable_params() = SwapParams();
    v1::Automation        resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.UpdateNodeParams(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
  {
    v1::AppendNodeRequest req;
    req.set_automation_id(automation.id());
    req.mutable_params()->mutable_swap()->set_slippage(2.0);
    v1::AppendNodeResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    assert(server.AppendNode(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    v1::StopExecutionRequest req;
    req.set_automation_id(automation.id());
    v1::StopExecutionResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    assert(server.StopExecution(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    v1::GetExecutionRequest req;
    req.set_id("missing-execution");
    v1::Execution         resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.GetExecution(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    v1::DeleteAutomationRequest req;
    req.set_id(automation.id());
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    assert(server.DeleteAutomation(&grpc_ctx, &req, &resp).ok());

    ::grpc::ServerContext again_ctx;
    assert(server.DeleteAutomation(&again_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
    assert(ctx.statuses->Find(automation.id()) == nullptr);
  }
}

} // namespace

int main() {
  TestCreateStartsWithDefaultGraph();
  TestAppendUsesAutomationSlippage();
  TestRemoveReportsDownstreamNodes();
  TestUpdateKeepsKindAndEdges();
  TestRunRecordsHistoryAndStatuses();
  TestStatusesBeforeAnyRunAreInitial();
  TestStopEndsTheRunBeforeTheNextNode();
  TestClearStaleFailsOnlyOldRunningExecutions();
  TestErrorKindsMapToStatusCodes();
  TestServerMapsErrorsToStatusCodes();

  std::cout << "pulse_automation_unit_automation_service: pass\n";
  return 0;
}
