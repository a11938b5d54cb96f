#pragma once

#include "flakeid/id/snowflake_generator.h"

#include "config.h"

namespace flakeid::server {

// ServerContext holds all process-lifetime references passed to every method handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  id::SnowflakeGenerator& generator;  // NOLINT(readability-identifier-naming)
  const ServerConfig& config;         // NOLINT(readability-identifier-naming)
};

}  // namespace flakeid::server
