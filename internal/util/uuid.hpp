#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace pulse::util {

/*
  UUID helpers

  Automation, execution and node ids use the textual RFC4122 v4 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Convenience for fresh textual ids, optionally prefixed ("swap-<uuid>").
std::string NewId(const std::string& prefix = {});

} // namespace pulse::util
