#include "internal/status/status_overlay.hpp"

namespace pulse::status {

std::optional<OverlayStyle> StyleFor(model::NodeStatus status) {
  switch (status) {
    case model::NodeStatus::kInitial:
      return std::nullopt;
    case model::NodeStatus::kLoading:
      return OverlayStyle{.treatment = OverlayTreatment::kPulsingBorder, .ring_color = "#3b82f6", .animated = true, .glow = false};
    case model::NodeStatus::kSuccess:
      return OverlayStyle{.treatment = OverlayTreatment::kSuccessRing, .ring_color = "#22c55e", .animated = false, .glow = true};
    case model::NodeStatus::kError:
      return OverlayStyle{.treatment = OverlayTreatment::kErrorRing, .ring_color = "#ef4444", .animated = false, .glow = true};
  }
  return std::nullopt;
}

bool HasWrappedChildShape(const ContentElement& content) {
  return !content.children.empty();
}

OverlayPlan PlanOverlay(model::NodeStatus status, const ContentElement& content, const std::vector<model::Handle>& handles) {
  OverlayPlan plan;
  plan.style = StyleFor(status);

  if (HasWrappedChildShape(content)) {
    plan.wrap              = WrapTarget::kBaseChild;
    plan.trailing_children = content.children.size() - 1;
  }

  plan.handle_anchors.reserve(handles.size());
  for (const auto& handle : handles) {
    plan.handle_anchors.push_back({handle, graph::AnchorOffsetFor(handle.position)});
  }
  return plan;
}

} // namespace pulse::status
