#pragma once

#include "config.h"
#include <string>

namespace flakeid::server {

// validate_server_config checks startup preconditions for the id server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no unknown, valueless or malformed flags
// - max_batch within 1..kMaxBatchLimit
// - node_id, when present, is "auto", -1, or an integer in [0, kMaxNodeId]
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace flakeid::server
