#include "automation_service.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_codec.hpp"
#include "internal/graph/graph_ops.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serialization/artifact_serializer.hpp"
#include "internal/status/status_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace pulse::service {

using namespace pulse::automation::v1;

namespace {

void ThrowIfError(const pulse::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  switch (result.code) {
    case pulse::db::ErrorCode::NotFound:
      throw pulse::util::NotFound(prefix + ": " + result.message);
    case pulse::db::ErrorCode::AlreadyExists:
      throw pulse::util::AlreadyExists(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.message);
  }
}

void RequireId(const std::string& value, std::string_view route, std::string_view field) {
  if (value.empty()) {
    throw pulse::util::InvalidArgument(std::string(route) + ": missing " + std::string(field) + "; set it and retry");
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& automation_id, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const pulse::util::Error& ex) {
    PULSE_LOG_WARN("RPC rejected", {pulse::observability::StringField("route", route), pulse::observability::StringField("kind", pulse::util::ToString(ex.kind())),
                                    pulse::observability::StringField("error", ex.what()),
                                    pulse::observability::StringField("automation_id", automation_id)});
    throw;
  } catch (const std::exception& ex) {
    PULSE_LOG_ERROR("RPC failed", {pulse::observability::StringField("route", route), pulse::observability::StringField("error", ex.what()),
                                   pulse::observability::StringField("automation_id", automation_id)});
    throw;
  }
}

pulse::model::SlippageTolerance StoredSlippage(const pulse::db::model::AutomationRecord& record) {
  return pulse::model::SlippageTolerance::FromDecimal(record.default_slippage);
}

pulse::model::Graph LoadGraph(const pulse::db::model::AutomationRecord& record) {
  return pulse::graph::FromJson(record.definition_json, StoredSlippage(record));
}

pulse::db::model::AutomationRecord LoadAutomation(pulse::db::Repository& repo, pulse::db::Transaction& tx, const std::string& id,
                                                  std::string_view route) {
  auto record = repo.GetAutomation(tx, id);
  if (!record) {
    throw pulse::util::NotFound(std::string(route) + ": automation '" + id + "' does not exist");
  }
  return *record;
}

Automation ToProto(const pulse::db::model::AutomationRecord& record, const pulse::model::Graph& graph) {
  Automation out;
  out.set_id(record.id);
  out.set_owner_id(record.owner_id);
  out.set_name(record.name);
  *out.mutable_graph() = pulse::graph::ToProto(graph);
  out.set_default_slippage(record.default_slippage);
  *out.mutable_created_at() = pulse::util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = pulse::util::MillisToProto(record.updated_at_ms);
  return out;
}

Execution ToProto(const pulse::db::model::ExecutionRecord& record) {
  Execution out;
  out.set_id(record.id);
  out.set_automation_id(record.automation_id);
  out.set_run_sequence(record.run_sequence);
  out.set_status(record.status);
  out.set_error(record.error);
  *out.mutable_started_at() = pulse::util::MillisToProto(record.started_at_ms);
  if (record.finished_at_ms != 0) {
    *out.mutable_finished_at() = pulse::util::MillisToProto(record.finished_at_ms);
  }
  return out;
}

ExecutionLog ToProto(const pulse::db::model::ExecutionLogRecord& record) {
  ExecutionLog out;
  out.set_node_id(record.node_id);
  out.set_node_type(record.node_type);
  *out.mutable_input()  = pulse::serialization::ArtifactFromJson(record.input_json);
  *out.mutable_output() = pulse::serialization::ArtifactFromJson(record.output_json);
  out.set_error(record.error);
  *out.mutable_created_at() = pulse::util::MillisToProto(record.created_at_ms);
  return out;
}

NodeStatus ToProto(pulse::model::NodeStatus status) {
  switch (status) {
    case pulse::model::NodeStatus::kInitial:
      return NODE_STATUS_INITIAL;
    case pulse::model::NodeStatus::kLoading:
      return NODE_STATUS_LOADING;
    case pulse::model::NodeStatus::kSuccess:
      return NODE_STATUS_SUCCESS;
    case pulse::model::NodeStatus::kError:
      return NODE_STATUS_ERROR;
  }
  return NODE_STATUS_UNSPECIFIED;
}

} // namespace

AutomationService::AutomationService(ServiceContext ctx) : ctx_(std::move(ctx)), coordinator_(ctx_.repository, ctx_.statuses) {
}

Automation AutomationService::CreateAutomation(const CreateAutomationRequest& req) {
  return ObserveRpc("AutomationService.CreateAutomation", "", [&] {
    if (req.name().empty()) {
      throw pulse::util::InvalidArgument("create automation: missing name; set name and retry");
    }

    const auto slippage =
        req.default_slippage() == 0.0 ? ctx_.default_slippage : pulse::model::SlippageTolerance::FromDecimal(req.default_slippage());
    const auto graph = pulse::graph::DefaultGraph();

    pulse::db::model::AutomationRecord record;
    record.id               = pulse::util::NewId();
    record.owner_id         = req.owner_id();
    record.name             = req.name();
    record.definition_json  = pulse::graph::ToJson(graph);
    record.default_slippage = slippage.decimal();
    record.created_at_ms    = pulse::util::NowMillis();
    record.updated_at_ms    = record.created_at_ms;

    auto tx = ctx_.repository->Begin();
    ThrowIfError(ctx_.repository->InsertAutomation(*tx, record), "create automation");
    tx->Commit();

    PULSE_LOG_INFO("Automation created", {pulse::observability::StringField("automation_id", record.id),
                                          pulse::observability::StringField("owner_id", record.owner_id)});
    return ToProto(record, graph);
  });
}

Automation AutomationService::GetAutomation(const GetAutomationRequest& req) {
  return ObserveRpc("AutomationService.GetAutomation", req.id(), [&] {
    RequireId(req.id(), "get automation", "id");

    auto tx     = ctx_.repository->Begin();
    auto record = LoadAutomation(*ctx_.repository, *tx, req.id(), "get automation");
    tx->Commit();
    return ToProto(record, LoadGraph(record));
  });
}

void AutomationService::DeleteAutomation(const DeleteAutomationRequest& req) {
  ObserveRpc("AutomationService.DeleteAutomation", req.id(), [&] {
    RequireId(req.id(), "delete automation", "id");

    auto tx = ctx_.repository->Begin();
    ThrowIfError(ctx_.repository->DeleteAutomation(*tx, req.id()), "delete automation");
    tx->Commit();

    ctx_.statuses->Drop(req.id());
    PULSE_LOG_INFO("Automation deleted", {pulse::observability::StringField("automation_id", req.id())});
  });
}

AppendNodeResponse AutomationService::AppendNode(const AppendNodeRequest& req) {
  return ObserveRpc("AutomationService.AppendNode", req.automation_id(), [&] {
    RequireId(req.automation_id(), "append node", "automation_id");
    if (!req.has_params()) {
      throw pulse::util::InvalidArgument("append node: missing params; set params and retry");
    }

    auto tx     = ctx_.repository->Begin();
    auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "append node");

    auto params  = pulse::graph::FromProto(req.params(), StoredSlippage(record));
    auto node_id = pulse::util::NewId(std::string(pulse::model::KindName(pulse::model::KindOf(params))));
    auto graph   = pulse::graph::AppendNode(LoadGraph(record), std::move(params), node_id, ctx_.node_spacing_x);

    record.definition_json = pulse::graph::ToJson(graph);
    record.updated_at_ms   = pulse::util::NowMillis();
    ThrowIfError(ctx_.repository->UpdateAutomation(*tx, record), "append node");
    tx->Commit();

    AppendNodeResponse resp;
    *resp.mutable_automation() = ToProto(record, graph);
    resp.set_node_id(node_id);
    return resp;
  });
}

Automation AutomationService::UpdateNodeParams(const UpdateNodeParamsRequest& req) {
  return ObserveRpc("AutomationService.UpdateNodeParams", req.automation_id(), [&] {
    RequireId(req.automation_id(), "update node", "automation_id");
    RequireId(req.node_id(), "update node", "node_id");
    if (!req.has_params()) {
      throw pulse::util::InvalidArgument("update node: missing params; set params and retry");
    }

    auto tx     = ctx_.repository->Begin();
    auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "update node");

    auto graph = pulse::graph::UpdateNodeParams(LoadGraph(record), req.node_id(), pulse::graph::FromProto(req.params(), StoredSlippage(record)));

    record.definition_json = pulse::graph::ToJson(graph);
    record.updated_at_ms   = pulse::util::NowMillis();
    ThrowIfError(ctx_.repository->UpdateAutomation(*tx, record), "update node");
    tx->Commit();
    return ToProto(record, graph);
  });
}

RemoveNodeResponse AutomationService::RemoveNode(const RemoveNodeRequest& req) {
  return ObserveRpc("AutomationService.RemoveNode", req.automation_id(), [&] {
    RequireId(req.automation_id(), "remove node", "automation_id");
    RequireId(req.node_id(), "remove node", "node_id");

    auto tx     = ctx_.repository->Begin();
    auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "remove node");

    const auto before  = LoadGraph(record);
    auto       removed = pulse::graph::DownstreamOf(before, req.node_id());
    auto       graph   = pulse::graph::RemoveNodeAndDownstream(before, req.node_id());
    removed.insert(removed.begin(), req.node_id());

    record.definition_json = pulse::graph::ToJson(graph);
    record.updated_at_ms   = pulse::util::NowMillis();
    ThrowIfError(ctx_.repository->UpdateAutomation(*tx, record), "remove node");
    tx->Commit();

    RemoveNodeResponse resp;
    *resp.mutable_automation() = ToProto(record, graph);
    for (auto& id : removed) {
      resp.add_removed_node_ids(std::move(id));
    }
    return resp;
  });
}

Automation AutomationService::ResetAutomation(const ResetAutomationRequest& req) {
  return ObserveRpc("AutomationService.ResetAutomation", req.automation_id(), [&] {
    RequireId(req.automation_id(), "reset automation", "automation_id");

    auto tx     = ctx_.repository->Begin();
    auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "reset automation");

    auto graph             = pulse::graph::ResetToStart(LoadGraph(record));
    record.definition_json = pulse::graph::ToJson(graph);
    record.updated_at_ms   = pulse::util::NowMillis();
    ThrowIfError(ctx_.repository->UpdateAutomation(*tx, record), "reset automation");
    tx->Commit();
    return ToProto(record, graph);
  });
}

execution::RunSummary AutomationService::RunAutomation(const RunAutomationRequest& req, execution::ProgressSink& sink) {
  return ObserveRpc("AutomationService.RunAutomation", req.automation_id(), [&] {
    RequireId(req.automation_id(), "run automation", "automation_id");

    // The coordinator opens its own transactions; the definition is read and
    // released first.
    pulse::model::Graph graph;
    {
      auto tx     = ctx_.repository->Begin();
      auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "run automation");
      tx->Commit();
      graph = LoadGraph(record);
    }
    return coordinator_.Run(req.automation_id(), graph, *ctx_.executor, sink);
  });
}

Execution AutomationService::GetExecution(const GetExecutionRequest& req) {
  return ObserveRpc("AutomationService.GetExecution", "", [&] {
    RequireId(req.id(), "get execution", "id");

    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetExecution(*tx, req.id());
    if (!record) {
      throw pulse::util::NotFound("get execution: execution '" + req.id() + "' does not exist");
    }
    auto logs = ctx_.repository->GetExecutionLogs(*tx, req.id());
    tx->Commit();

    auto out = ToProto(*record);
    for (const auto& log : logs) {
      *out.add_logs() = ToProto(log);
    }
    return out;
  });
}

ListExecutionsResponse AutomationService::ListExecutions(const ListExecutionsRequest& req) {
  return ObserveRpc("AutomationService.ListExecutions", req.automation_id(), [&] {
    RequireId(req.automation_id(), "list executions", "automation_id");

    std::optional<uint64_t> limit;
    if (req.limit() != 0) {
      limit = req.limit();
    }

    auto tx = ctx_.repository->Begin();
    LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "list executions");
    auto records = ctx_.repository->ListExecutions(*tx, req.automation_id(), limit);
    tx->Commit();

    ListExecutionsResponse resp;
    for (const auto& record : records) {
      *resp.add_executions() = ToProto(record);
    }
    return resp;
  });
}

StopExecutionResponse AutomationService::StopExecution(const StopExecutionRequest& req) {
  return ObserveRpc("AutomationService.StopExecution", req.automation_id(), [&] {
    RequireId(req.automation_id(), "stop execution", "automation_id");

    auto tx = ctx_.repository->Begin();
    LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "stop execution");

    std::optional<pulse::db::model::ExecutionRecord> active;
    for (auto& record : ctx_.repository->ListExecutions(*tx, req.automation_id(), std::nullopt)) {
      if (record.status == RUN_STATUS_RUNNING) {
        active = std::move(record);
        break;
      }
    }
    if (!active) {
      throw pulse::util::NotFound("stop execution: automation '" + req.automation_id() + "' has no running execution");
    }

    active->status         = RUN_STATUS_CANCELLED;
    active->error          = "Cancelled by user";
    active->finished_at_ms = pulse::util::NowMillis();
    ThrowIfError(ctx_.repository->UpdateExecution(*tx, *active), "stop execution");
    tx->Commit();

    PULSE_LOG_INFO("Execution cancelled", {pulse::observability::StringField("automation_id", req.automation_id()),
                                           pulse::observability::StringField("execution_id", active->id)});
    StopExecutionResponse resp;
    resp.set_execution_id(active->id);
    return resp;
  });
}

ClearStaleExecutionsResponse AutomationService::ClearStaleExecutions(const ClearStaleExecutionsRequest& req) {
  return ObserveRpc("AutomationService.ClearStaleExecutions", "", [&] {
    const uint64_t threshold_ms = req.stale_after_seconds() != 0 ? static_cast<uint64_t>(req.stale_after_seconds()) * 1000 : ctx_.stale_after_ms;
    const uint64_t now_ms       = pulse::util::NowMillis();
    const uint64_t cutoff_ms    = now_ms > threshold_ms ? now_ms - threshold_ms : 0;

    ClearStaleExecutionsResponse resp;

    auto tx = ctx_.repository->Begin();
    for (auto& record : ctx_.repository->ListRunningExecutions(*tx, cutoff_ms)) {
      if (!req.owner_id().empty()) {
        auto automation = ctx_.repository->GetAutomation(*tx, record.automation_id);
        if (!automation || automation->owner_id != req.owner_id()) {
          continue;
        }
      }
      record.status         = RUN_STATUS_FAILED;
      record.error          = "Execution timed out";
      record.finished_at_ms = now_ms;
      ThrowIfError(ctx_.repository->UpdateExecution(*tx, record), "clear stale executions");
      resp.add_execution_ids(record.id);
    }
    tx->Commit();

    if (resp.execution_ids_size() > 0) {
      PULSE_LOG_WARN("Stale executions failed", {pulse::observability::IntField("count", resp.execution_ids_size()),
                                                 pulse::observability::IntField("stale_after_ms", static_cast<int64_t>(threshold_ms))});
    }
    return resp;
  });
}

GetNodeStatusesResponse AutomationService::GetNodeStatuses(const GetNodeStatusesRequest& req) {
  return ObserveRpc("AutomationService.GetNodeStatuses", req.automation_id(), [&] {
    RequireId(req.automation_id(), "get node statuses", "automation_id");

    pulse::model::Graph                                         graph;
    std::map<std::string, pulse::db::model::NodeResultRecord> results;
    {
      auto tx     = ctx_.repository->Begin();
      auto record = LoadAutomation(*ctx_.repository, *tx, req.automation_id(), "get node statuses");
      for (auto& result : ctx_.repository->ListNodeResults(*tx, req.automation_id())) {
        auto node_id = result.node_id;
        results.emplace(std::move(node_id), std::move(result));
      }
      tx->Commit();
      graph = LoadGraph(record);
    }

    GetNodeStatusesResponse resp;
    auto                    board = ctx_.statuses->Find(req.automation_id());
    if (board) {
      if (auto run = board->current_run()) {
        resp.mutable_current_run()->set_execution_id(run->execution_id);
        resp.mutable_current_run()->set_sequence(run->sequence);
      }
    }

    // Graph order; nodes the board has never seen are initial.
    for (const auto& node : graph.nodes) {
      auto* entry = resp.add_statuses();
      entry->set_node_id(node.id);
      entry->set_status(ToProto(board ? board->StatusOf(node.id) : pulse::model::NodeStatus::kInitial));

      auto result = results.find(node.id);
      if (result == results.end()) {
        continue;
      }
      try {
        *entry->mutable_latest_result() = pulse::serialization::ArtifactFromJson(result->second.artifact_json);
        entry->mutable_result_run()->set_execution_id(result->second.execution_id);
        entry->mutable_result_run()->set_sequence(result->second.run_sequence);
      } catch (const pulse::util::InvalidArgument& e) {
        entry->clear_latest_result();
        PULSE_LOG_WARN("Stored node result is not a valid artifact",
                       {pulse::observability::StringField("node_id", node.id), pulse::observability::StringField("error", e.what())});
      }
    }
    return resp;
  });
}

} // namespace pulse::service
