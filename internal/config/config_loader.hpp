#pragma once

#include <string>

#include "config/config.pb.h"

namespace shardfeed::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Consumer durations take protobuf JSON seconds ("1s", "0.5s")
  or "250ms", "2m", "1h".

  SHARDFEED_WORKER_ID and SHARDFEED_STREAM_NAME, when set, override the
  file's consumer.worker_id and consumer.stream_name.
*/
class ConfigLoader {
 public:
  static shardfeed::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static shardfeed::runtime::config::RuntimeConfig ParseYaml(const std::string& content);
};

} // namespace shardfeed::config
