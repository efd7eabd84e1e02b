#pragma once

#include <cstdint>
#include <string_view>

namespace pulse::model {

enum class NodeStatus : std::uint8_t {
  kInitial = 0,
  kLoading = 1,
  kSuccess = 2,
  kError = 3,
};

constexpr bool IsSettled(NodeStatus status) {
  return status == NodeStatus::kSuccess || status == NodeStatus::kError;
}

// Legal moves within and between runs. Repeating the current status is
// always allowed and has no effect.
constexpr bool CanTransition(NodeStatus from, NodeStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case NodeStatus::kInitial:
      return to == NodeStatus::kLoading;
    case NodeStatus::kLoading:
      return IsSettled(to);
    case NodeStatus::kSuccess:
    case NodeStatus::kError:
      return to == NodeStatus::kInitial;
  }
  return false;
}

constexpr std::string_view ToString(NodeStatus status) {
  switch (status) {
    case NodeStatus::kInitial:
      return "initial";
    case NodeStatus::kLoading:
      return "loading";
    case NodeStatus::kSuccess:
      return "success";
    case NodeStatus::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace pulse::model
