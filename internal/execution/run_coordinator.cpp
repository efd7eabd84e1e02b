#include "internal/execution/run_coordinator.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <google/protobuf/util/json_util.h>

#include "internal/db/api/repository.hpp"
#include "internal/execution/execution_context.hpp"
#include "internal/graph/graph_codec.hpp"
#include "internal/graph/graph_ops.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serialization/artifact_serializer.hpp"
#include "internal/status/status_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace pulse::execution {

namespace v1 = pulse::automation::v1;

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

std::string ParamsJson(const model::NodeParams& params) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(graph::ToProto(params), &json);
  if (!status.ok()) {
    throw std::runtime_error("encode node params: " + std::string(status.message()));
  }
  return json;
}

// Forwards events until the consumer goes away, then drops them.
class GuardedSink {
 public:
  GuardedSink(ProgressSink& sink, const status::RunId& run) : sink_(sink), run_(run) {
  }

  void Publish(v1::ProgressEvent event) {
    if (closed_) {
      return;
    }
    event.mutable_run_id()->set_execution_id(run_.execution_id);
    event.mutable_run_id()->set_sequence(run_.sequence);
    event.set_execution_id(run_.execution_id);

    bool accepted = false;
    try {
      accepted = sink_.Publish(event);
    } catch (const std::exception& e) {
      PULSE_LOG_WARN("Progress consumer failed", {StringField("error", e.what())});
    }
    if (!accepted) {
      closed_ = true;
      PULSE_LOG_INFO("Progress consumer disconnected; run continues");
    }
  }

 private:
  ProgressSink&        sink_;
  const status::RunId& run_;
  bool                 closed_ = false;
};

v1::ProgressEvent NodeEvent(v1::ProgressEventType type, const model::Node& node) {
  v1::ProgressEvent event;
  event.set_type(type);
  event.set_node_id(node.id);
  event.set_node_type(std::string(model::KindName(node.kind())));
  return event;
}

std::string NodeFailure(const model::Node& node, const std::string& reason) {
  return "Node " + node.id + " (" + std::string(model::KindName(node.kind())) + ") failed: " + reason;
}

} // namespace

RunCoordinator::RunCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<status::StatusRegistry> statuses)
    : repository_(std::move(repository)), statuses_(std::move(statuses)) {
}

db::model::ExecutionRecord RunCoordinator::BeginExecution(const std::string& automation_id, const std::vector<std::string>& order,
                                                          status::StatusBoard& board) {
  db::model::ExecutionRecord record;
  record.id            = util::NewId();
  record.automation_id = automation_id;
  record.status        = v1::RUN_STATUS_RUNNING;
  record.started_at_ms = util::NowMillis();

  // The transaction holds the repository's writer lock, so the sequence is
  // allocated and handed to the board without another run in between. A
  // refused BeginRun rolls the record back.
  auto tx             = repository_->Begin();
  record.run_sequence = repository_->NextRunSequence(*tx, automation_id);
  ThrowIfError(repository_->InsertExecution(*tx, record), "run: insert execution");

  const status::RunId run{record.id, record.run_sequence};
  board.BeginRun(run, order);
  try {
    tx->Commit();
  } catch (const std::exception&) {
    board.FinishRun(run);
    throw;
  }
  return record;
}

std::optional<db::model::ExecutionRecord> RunCoordinator::EndedElsewhere(const std::string& execution_id) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetExecution(*tx, execution_id);
  tx->Commit();

  if (!stored) {
    db::model::ExecutionRecord gone;
    gone.id     = execution_id;
    gone.status = v1::RUN_STATUS_FAILED;
    gone.error  = "Execution record was removed";
    return gone;
  }
  if (stored->status != v1::RUN_STATUS_RUNNING) {
    return stored;
  }
  return std::nullopt;
}

void RunCoordinator::RecordOutcome(db::model::ExecutionRecord& record, RunSummary& summary) {
  record.status         = summary.status;
  record.error          = summary.error;
  record.finished_at_ms = util::NowMillis();
  try {
    auto tx     = repository_->Begin();
    auto stored = repository_->GetExecution(*tx, record.id);
    if (stored && stored->status != v1::RUN_STATUS_RUNNING) {
      summary.status = stored->status;
      summary.error  = stored->error;
      record         = *stored;
      tx->Commit();
      return;
    }
    ThrowIfError(repository_->UpdateExecution(*tx, record), "run: update execution");
    tx->Commit();
  } catch (const std::exception& e) {
    PULSE_LOG_ERROR("Failed to record run outcome", {StringField("error", e.what())});
  }
}

RunSummary RunCoordinator::Run(const std::string& automation_id, const model::Graph& graph, ChainExecutor& executor, ProgressSink& sink) {
  if (graph.nodes.empty()) {
    throw util::InvalidGraph("run: automation has no nodes to execute");
  }
  graph::ValidateGraph(graph);
  const auto order = graph::ExecutionOrder(graph);

  // ------------------------------------------------------------------
  // Execution record + run on the board
  // ------------------------------------------------------------------
  auto board  = statuses_->BoardFor(automation_id);
  auto record = BeginExecution(automation_id, order, *board);

  RunSummary summary;
  summary.execution_id = record.id;
  summary.run          = status::RunId{record.id, record.run_sequence};

  observability::LogScope scope({StringField("automation_id", automation_id), StringField("execution_id", record.id),
                                 IntField("run_sequence", static_cast<int64_t>(record.run_sequence))});
  PULSE_LOG_INFO("Run started", {IntField("nodes", static_cast<int64_t>(order.size()))});

  GuardedSink      events(sink, summary.run);
  ExecutionContext context(automation_id, summary.run);

  // Log and latest-result writes are best effort: a storage or encoding
  // failure is logged but never changes the node's outcome.
  auto persist = [&](const model::Node& node, const google::protobuf::Value* artifact, const std::string& error) {
    try {
      const auto output_json = artifact != nullptr ? serialization::ToJson(*artifact) : std::string("null");
      auto       tx          = repository_->Begin();

      db::model::ExecutionLogRecord log;
      log.execution_id  = record.id;
      log.node_id       = node.id;
      log.node_type     = std::string(model::KindName(node.kind()));
      log.input_json    = ParamsJson(node.params);
      log.output_json   = output_json;
      log.error         = error;
      log.created_at_ms = util::NowMillis();
      ThrowIfError(repository_->InsertExecutionLog(*tx, log), "run: insert execution log");

      if (artifact != nullptr) {
        db::model::NodeResultRecord result;
        result.automation_id = automation_id;
        result.node_id       = node.id;
        result.execution_id  = record.id;
        result.run_sequence  = record.run_sequence;
        result.artifact_json = output_json;
        result.updated_at_ms = log.created_at_ms;
        ThrowIfError(repository_->UpsertNodeResult(*tx, result), "run: upsert node result");
      }
      tx->Commit();
    } catch (const std::exception& e) {
      PULSE_LOG_ERROR("Failed to persist node outcome", {StringField("node_id", node.id), StringField("error", e.what())});
    }
  };

  auto fail_node = [&](const model::Node& node, const std::string& reason) {
    board->SetStatus(summary.run, node.id, model::NodeStatus::kError);
    persist(node, nullptr, reason);

    auto event = NodeEvent(v1::PROGRESS_EVENT_TYPE_NODE_ERROR, node);
    event.set_error(reason);
    events.Publish(std::move(event));

    summary.failed_node_id = node.id;
    summary.error          = NodeFailure(node, reason);
    PULSE_LOG_WARN("Node failed", {StringField("node_id", node.id), StringField("error", reason)});
  };

  // ------------------------------------------------------------------
  // Nodes
  // ------------------------------------------------------------------
  bool               ended_elsewhere = false;
  const model::Node* current         = nullptr;
  try {
    for (const auto& node_id : order) {
      const auto* node = graph.FindNode(node_id);
      if (node->kind() == model::NodeKind::kStart) {
        continue;
      }

      if (auto ended = EndedElsewhere(record.id)) {
        ended_elsewhere = true;
        summary.status  = ended->status;
        summary.error   = ended->error;
        PULSE_LOG_INFO("Run ended before node", {StringField("node_id", node->id), StringField("reason", ended->error)});
        break;
      }

      current = node;
      board->SetStatus(summary.run, node->id, model::NodeStatus::kLoading);
      events.Publish(NodeEvent(v1::PROGRESS_EVENT_TYPE_NODE_START, *node));

      std::optional<serialization::ChainValue> output;
      std::string                              failure;
      try {
        output = executor.Execute(*node, context);
      } catch (const std::exception& e) {
        failure = e.what();
      } catch (...) {
        failure = "executor raised a non-standard exception";
      }

      if (!output) {
        current = nullptr;
        fail_node(*node, failure);
        break;
      }

      const auto artifact = serialization::Serialize(*output);
      context.Record(*node, std::move(*output));
      persist(*node, &artifact, {});

      board->SetStatus(summary.run, node->id, model::NodeStatus::kSuccess);
      current = nullptr;

      auto event = NodeEvent(v1::PROGRESS_EVENT_TYPE_NODE_COMPLETE, *node);
      *event.mutable_data() = artifact;
      events.Publish(std::move(event));

      summary.completed_node_ids.push_back(node->id);
    }
  } catch (const std::exception& e) {
    PULSE_LOG_ERROR("Run aborted", {StringField("error", e.what())});
    if (current != nullptr) {
      fail_node(*current, e.what());
    } else {
      summary.error = std::string("Run aborted: ") + e.what();
    }
  }

  // ------------------------------------------------------------------
  // Finish
  // ------------------------------------------------------------------
  board->FinishRun(summary.run);
  if (!ended_elsewhere) {
    summary.status = summary.error.empty() ? v1::RUN_STATUS_SUCCESS : v1::RUN_STATUS_FAILED;
  }
  RecordOutcome(record, summary);
  summary.success = summary.status == v1::RUN_STATUS_SUCCESS;

  v1::ProgressEvent done;
  done.set_type(v1::PROGRESS_EVENT_TYPE_DONE);
  done.set_success(summary.success);
  done.set_error(summary.error);
  done.set_run_status(summary.status);
  events.Publish(std::move(done));

  PULSE_LOG_INFO("Run finished", {StringField("status", v1::RunStatus_Name(summary.status)),
                                  IntField("completed_nodes", static_cast<int64_t>(summary.completed_node_ids.size()))});
  return summary;
}

} // namespace pulse::execution
