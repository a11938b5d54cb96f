#pragma once

#include "flakeid/core/result.h"
#include "flakeid/id/node_id.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::server {

// Largest count a single id/generate request may ask for when --max-batch is not given.
constexpr std::int64_t kDefaultMaxBatch = 1000;
// Upper bound accepted for --max-batch: one millisecond worth of sequence values.
constexpr std::int64_t kMaxBatchLimit = 4096;

// ServerConfig holds all parsed startup flags for the id server.
// Every field has an explicit default; optional fields mean "not configured".
struct ServerConfig {
  // Raw --node-id value; absent means auto-derive.
  std::optional<std::string> node_id;         // NOLINT(readability-identifier-naming)
  std::int64_t max_batch{kDefaultMaxBatch};  // NOLINT(readability-identifier-naming)
  // Messages for unknown or rejected flags, reported by validate_server_config.
  std::vector<std::string> arg_errors;  // NOLINT(readability-identifier-naming)
};

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// node_id_setting interprets config.node_id; absent means auto.
[[nodiscard]] core::Result<id::NodeIdSetting, core::IdError> node_id_setting(
    const ServerConfig& config);

}  // namespace flakeid::server
