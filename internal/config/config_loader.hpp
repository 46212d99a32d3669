#pragma once

#include <string>

#include "config/config.pb.h"

namespace strata::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so config/config.proto
  is the single source of truth for the shape (unknown keys fail). Values
  the schema can't express are checked afterwards:

    - ledger.table_name        [A-Za-z_][A-Za-z0-9_]* when set
    - ledger.sqlite.path       required when the sqlite block is present
    - ledger.postgres.connection_uri  required when the postgres block is present
    - lock.name                no '/'
    - logging.level            a spdlog level name when set

  Every failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static strata::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static strata::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace strata::config
