#include "internal/status/status_board.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pulse::status {

using model::NodeStatus;

std::string_view ToString(UpdateOutcome outcome) {
  switch (outcome) {
    case UpdateOutcome::kApplied:
      return "applied";
    case UpdateOutcome::kUnchanged:
      return "unchanged";
    case UpdateOutcome::kStale:
      return "stale";
    case UpdateOutcome::kRejected:
      return "rejected";
  }
  return "unknown";
}

StatusBoard::StatusBoard(std::string automation_id) : automation_id_(std::move(automation_id)) {
}

void StatusBoard::BeginRun(const RunId& run, const std::vector<std::string>& node_ids) {
  std::vector<StatusChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_run_ && run.sequence <= current_run_->sequence) {
      throw util::InvalidState("begin run: sequence " + std::to_string(run.sequence) + " is not newer than current run sequence " +
                               std::to_string(current_run_->sequence));
    }

    for (auto& [node_id, status] : statuses_) {
      if (status != NodeStatus::kInitial) {
        status = NodeStatus::kInitial;
        changes.push_back({run, node_id, NodeStatus::kInitial});
      }
    }
    for (const auto& node_id : node_ids) {
      statuses_.try_emplace(node_id, NodeStatus::kInitial);
    }

    current_run_ = run;
    run_active_  = true;
  }
  Notify(changes);
}

UpdateOutcome StatusBoard::SetStatus(const RunId& run, const std::string& node_id, NodeStatus status) {
  StatusChange change{run, node_id, status};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_run_ || !run_active_ || run != *current_run_) {
      PULSE_LOG_WARN("Discarded stale status update",
                     {observability::StringField("automation_id", automation_id_), observability::StringField("node_id", node_id),
                      observability::StringField("execution_id", run.execution_id), observability::IntField("run_sequence", run.sequence),
                      observability::StringField("status", model::ToString(status))});
      return UpdateOutcome::kStale;
    }

    auto  it   = statuses_.try_emplace(node_id, NodeStatus::kInitial).first;
    auto& from = it->second;
    if (from == status) {
      return UpdateOutcome::kUnchanged;
    }
    if (!model::CanTransition(from, status)) {
      PULSE_LOG_WARN("Rejected status transition",
                     {observability::StringField("automation_id", automation_id_), observability::StringField("node_id", node_id),
                      observability::StringField("from", model::ToString(from)), observability::StringField("to", model::ToString(status))});
      return UpdateOutcome::kRejected;
    }
    from = status;
  }
  Notify({change});
  return UpdateOutcome::kApplied;
}

std::vector<std::string> StatusBoard::FinishRun(const RunId& run) {
  std::vector<std::string>  forced;
  std::vector<StatusChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_run_ || run != *current_run_ || !run_active_) {
      return forced;
    }

    for (auto& [node_id, status] : statuses_) {
      if (status == NodeStatus::kLoading) {
        status = NodeStatus::kError;
        forced.push_back(node_id);
        changes.push_back({run, node_id, NodeStatus::kError});
      }
    }
    run_active_ = false;
  }
  Notify(changes);
  return forced;
}

NodeStatus StatusBoard::StatusOf(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = statuses_.find(node_id);
  return it == statuses_.end() ? NodeStatus::kInitial : it->second;
}

std::vector<std::pair<std::string, NodeStatus>> StatusBoard::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {statuses_.begin(), statuses_.end()};
}

std::optional<RunId> StatusBoard::current_run() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_run_;
}

bool StatusBoard::IsRunActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return run_active_;
}

std::uint64_t StatusBoard::Subscribe(StatusListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

bool StatusBoard::Unsubscribe(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.erase(id) > 0;
}

void StatusBoard::Notify(const std::vector<StatusChange>& changes) const {
  if (changes.empty()) {
    return;
  }

  std::vector<StatusListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }

  for (const auto& change : changes) {
    for (const auto& listener : listeners) {
      try {
        listener(change);
      } catch (const std::exception& e) {
        PULSE_LOG_ERROR("Status listener failed",
                        {observability::StringField("automation_id", automation_id_), observability::StringField("node_id", change.node_id),
                         observability::StringField("error", e.what())});
      }
    }
  }
}

} // namespace pulse::status
