#pragma once

#include <optional>

#include "internal/model/handle.hpp"
#include "internal/model/node.hpp"

namespace pulse::graph {

/*
  Where a handle (and anything anchored to it) sits on its node.

  (fx, fy) is the anchor as a fraction of the node's bounding box;
  (translate_x, translate_y) is the shift, as a fraction of the anchored
  element's own size, that centres it on the anchor. Depends on nothing
  but the declared position, so the editor and the status overlay can
  compute it independently.
*/
struct AnchorOffset {
  double fx;
  double fy;
  double translate_x;
  double translate_y;

  constexpr bool operator==(const AnchorOffset&) const = default;
};

struct Rect {
  double x      = 0.0;
  double y      = 0.0;
  double width  = 0.0;
  double height = 0.0;
};

constexpr AnchorOffset AnchorOffsetFor(std::optional<model::HandlePosition> position) {
  if (!position.has_value()) {
    return {0.5, 0.5, -0.5, -0.5};
  }
  switch (*position) {
    case model::HandlePosition::kTop:
      return {0.5, 0.0, -0.5, -0.5};
    case model::HandlePosition::kBottom:
      return {0.5, 1.0, -0.5, 0.5};
    case model::HandlePosition::kLeft:
      return {0.0, 0.5, -0.5, -0.5};
    case model::HandlePosition::kRight:
      return {1.0, 0.5, 0.5, -0.5};
  }
  return {0.5, 0.5, -0.5, -0.5};
}

constexpr model::Point AnchorPoint(std::optional<model::HandlePosition> position, const Rect& bounds) {
  const auto offset = AnchorOffsetFor(position);
  return {bounds.x + offset.fx * bounds.width, bounds.y + offset.fy * bounds.height};
}

} // namespace pulse::graph
