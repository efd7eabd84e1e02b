#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/handle_layout.hpp"
#include "internal/model/handle.hpp"
#include "internal/model/node_status.hpp"

namespace pulse::status {

enum class OverlayTreatment : std::uint8_t {
  kPulsingBorder,  // loading
  kSuccessRing,    // green ring and glow
  kErrorRing,      // red ring and glow
};

struct OverlayStyle {
  OverlayTreatment treatment;
  std::string      ring_color;
  bool             animated = false;
  bool             glow     = false;
  // Overlays never take hit-testing from the node or its handles.
  bool pointer_events = false;
};

// Minimal description of a node's rendered content.
struct ContentElement {
  std::string                 name;
  std::vector<ContentElement> children;
};

enum class WrapTarget : std::uint8_t {
  kBaseChild,  // overlay wraps children[0]; the rest render after it
  kWholeNode,
};

struct HandleAnchor {
  model::Handle      handle;
  graph::AnchorOffset offset;
};

struct OverlayPlan {
  std::optional<OverlayStyle> style;  // empty for initial
  WrapTarget                  wrap = WrapTarget::kWholeNode;
  std::size_t                 trailing_children = 0;
  std::vector<HandleAnchor>   handle_anchors;
};

std::optional<OverlayStyle> StyleFor(model::NodeStatus status);

// True when content is a single element whose first child is the node's base.
bool HasWrappedChildShape(const ContentElement& content);

OverlayPlan PlanOverlay(model::NodeStatus status, const ContentElement& content, const std::vector<model::Handle>& handles = {});

} // namespace pulse::status
