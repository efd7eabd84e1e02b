#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/node_status.hpp"

namespace pulse::status {

// Identifies one execution of an automation. Sequences grow per automation.
struct RunId {
  std::string   execution_id;
  std::uint64_t sequence = 0;

  bool operator==(const RunId&) const = default;
};

enum class UpdateOutcome : std::uint8_t {
  kApplied,
  kUnchanged,  // same status again, nothing notified
  kStale,      // not the current run, or the run has finished
  kRejected,   // illegal transition
};

std::string_view ToString(UpdateOutcome outcome);

struct StatusChange {
  RunId             run;
  std::string       node_id;
  model::NodeStatus status;
};

using StatusListener = std::function<void(const StatusChange&)>;

/*
  StatusBoard

  Per-automation node status for the current run.

  Every update names the run it belongs to; updates for any run other than
  the current one are discarded. Listeners are invoked after the board's
  lock is released, in the order the changes were applied.
*/
class StatusBoard {
 public:
  explicit StatusBoard(std::string automation_id);

  StatusBoard(const StatusBoard&)            = delete;
  StatusBoard& operator=(const StatusBoard&) = delete;

  const std::string& automation_id() const {
    return automation_id_;
  }

  // Resets every known node (and every id in node_ids) to initial, then makes
  // `run` current. A sequence not above the current run's is refused.
  void BeginRun(const RunId& run, const std::vector<std::string>& node_ids = {});

  UpdateOutcome SetStatus(const RunId& run, const std::string& node_id, model::NodeStatus status);

  // Nodes still loading become error. Returns their ids.
  std::vector<std::string> FinishRun(const RunId& run);

  model::NodeStatus StatusOf(const std::string& node_id) const;

  std::vector<std::pair<std::string, model::NodeStatus>> Snapshot() const;

  std::optional<RunId> current_run() const;
  bool                 IsRunActive() const;

  std::uint64_t Subscribe(StatusListener listener);
  bool          Unsubscribe(std::uint64_t id);

 private:
  void Notify(const std::vector<StatusChange>& changes) const;

  const std::string automation_id_;

  mutable std::mutex                              mutex_;
  std::map<std::string, model::NodeStatus>        statuses_;
  std::optional<RunId>                            current_run_;
  bool                                            run_active_ = false;
  std::map<std::uint64_t, StatusListener>         listeners_;
  std::uint64_t                                   next_listener_id_ = 1;
};

} // namespace pulse::status
