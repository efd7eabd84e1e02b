#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pulse::model {

enum class HandleKind : std::uint8_t {
  kSource,
  kTarget,
};

enum class HandlePosition : std::uint8_t {
  kTop,
  kBottom,
  kLeft,
  kRight,
};

/*
  Named attachment point on a node.

  An unset id is the node's default handle of that kind. Two handles of the
  same kind on one node never share an id.
*/
struct Handle {
  std::optional<std::string> id;
  HandleKind                 kind     = HandleKind::kSource;
  HandlePosition             position = HandlePosition::kRight;
  // "insert next step" affordance anchored on this handle
  bool show_button = false;
};

}  // namespace pulse::model
