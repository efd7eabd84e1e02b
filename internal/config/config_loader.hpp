#pragma once

#include <string>

#include "config/config.pb.h"

namespace pulse::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed strictly into protobuf. The result
  is validated (sqlite path, log level, slippage tolerance, node spacing)
  and every execution field left at zero is filled with its default, so
  callers never see an unset execution section.
*/
class ConfigLoader {
 public:
  static pulse::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace pulse::config
