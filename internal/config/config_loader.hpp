#pragma once

#include <string>

#include "config/config.pb.h"

namespace unison::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys
  are rejected. Quoted scalars stay strings, so `queues: ["42"]`
  names a queue rather than a number.
*/
class ConfigLoader {
 public:
  static unison::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static unison::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  /*
    Overrides from the process environment:

      QUEUE_VISIBILITY_TIMEOUT   queue.visibility_timeout_sec
      QUEUE_MAX_RETRIES          queue.max_retries
      QUEUE_NAME_PREFIX          queue.name_prefix
      UNISON_DATABASE_URL        database.postgres.connection_uri

    Throws std::runtime_error on a malformed number.
  */
  static void ApplyEnvironment(unison::runtime::config::RuntimeConfig& config);
};

} // namespace unison::config
