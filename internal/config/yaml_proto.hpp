#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <yaml-cpp/yaml.h>

namespace waterfall::config {

/*
  Fills a protobuf message from a YAML document.

  YAML is converted to a google.protobuf.Value, serialized to JSON and parsed
  into the target message. Unknown fields are rejected.

  Plain scalars that look like numbers or booleans are typed accordingly;
  quoted scalars always stay strings.

  Throws std::runtime_error on malformed input.
*/
void YamlToMessage(const YAML::Node& node, google::protobuf::Message* message);

void LoadYamlFile(const std::string& path, google::protobuf::Message* message);

} // namespace waterfall::config
