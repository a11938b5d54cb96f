#pragma once

#include "flakeid/core/result.h"

#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace flakeid::server {

using MethodOutcome = core::Result<nlohmann::json, MethodError>;
using MethodHandler = std::function<MethodOutcome(const JsonRpcRequest& req, ServerContext& ctx)>;

MethodOutcome handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace flakeid::server
