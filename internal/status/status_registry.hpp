#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/status/status_board.hpp"

namespace pulse::status {

// Automation id -> status board. Boards are created on first use.
class StatusRegistry {
 public:
  std::shared_ptr<StatusBoard> BoardFor(const std::string& automation_id);
  std::shared_ptr<StatusBoard> Find(const std::string& automation_id) const;
  void                         Drop(const std::string& automation_id);

 private:
  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<StatusBoard>> boards_;
};

} // namespace pulse::status
