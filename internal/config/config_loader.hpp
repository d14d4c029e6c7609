#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace loadplan::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. The same path is
  used for any message, so request files share the config syntax.
*/
class ConfigLoader {
 public:
  static loadplan::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);
  static void ParseMessageFromYamlString(const std::string& yaml, google::protobuf::Message* message);
};

} // namespace loadplan::config
