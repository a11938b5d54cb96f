#include "startup_guard.h"

#include "flakeid/id/layout.h"

#include <string>

namespace flakeid::server {

std::string validate_server_config(const ServerConfig& config) {
  if (!config.arg_errors.empty()) {
    return "Error: " + config.arg_errors.front() +
           "\n"
           "       Usage: flakeid_server [--node-id <0..1023|auto>] [--max-batch <1..4096>]";
  }

  if (config.max_batch < 1 || config.max_batch > kMaxBatchLimit) {
    return "Error: --max-batch must be between 1 and " + std::to_string(kMaxBatchLimit) + ".";
  }

  const auto setting = node_id_setting(config);
  if (!setting.has_value()) {
    return "Error: --node-id '" + config.node_id.value_or("") +
           "' is not a number.\n"
           "       Accepted values: auto, -1, or an integer in 0.." +
           std::to_string(id::kMaxNodeId);
  }

  const auto& explicit_id = setting.value().explicit_id;
  if (explicit_id.has_value() && (*explicit_id < 0 || *explicit_id > id::kMaxNodeId)) {
    return "Error: --node-id must be between 0 and " + std::to_string(id::kMaxNodeId) +
           " (got " + std::to_string(*explicit_id) + ").";
  }

  return "";
}

}  // namespace flakeid::server
