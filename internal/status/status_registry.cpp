#include "internal/status/status_registry.hpp"

namespace pulse::status {

std::shared_ptr<StatusBoard> StatusRegistry::BoardFor(const std::string& automation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto&                       board = boards_[automation_id];
  if (!board) {
    board = std::make_shared<StatusBoard>(automation_id);
  }
  return board;
}

std::shared_ptr<StatusBoard> StatusRegistry::Find(const std::string& automation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = boards_.find(automation_id);
  return it == boards_.end() ? nullptr : it->second;
}

void StatusRegistry::Drop(const std::string& automation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  boards_.erase(automation_id);
}

} // namespace pulse::status
